#include "WeatherUtils.hpp"

#include <format> // std::format

#include "Nimbus/Utils/Logging.hpp"

#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace nimbus::services::weather::utils {
  fn HttpGet(const String& url) -> Result<HttpResponse> {
    HttpResponse response { .status = 0, .body = {} };

    Curl::Easy curl({
      .url                = url,
      .writeBuffer        = &response.body,
      .timeoutSecs        = 10L,
      .connectTimeoutSecs = 5L,
      .userAgent          = "nimbus/1.0",
    });

    if (!curl) {
      if (const Option<NimbusError>& initError = curl.getInitializationError())
        return Err(*initError);

      ERR(ApiUnavailable, "Failed to initialize cURL (Easy handle is invalid after construction)");
    }

    debug_log("GET {}", url);

    if (Result res = curl.perform(); !res)
      return Err(res.error());

    Result<i64> status = curl.getResponseCode();
    if (!status)
      return Err(status.error());

    response.status = *status;

    return response;
  }

  fn EscapeQuery(const StringView value) -> Result<String> {
    return Curl::Easy::escape(String(value));
  }

  fn GetOpenmeteoWeatherDescription(const i32 code) -> String {
    // WMO Weather interpretation codes (WW)
    // https://open-meteo.com/en/docs
    using matchit::match, matchit::is, matchit::or_, matchit::_, matchit::and_;

    const auto between = [](const i32 low, const i32 high) {
      return and_(_ >= low, _ <= high);
    };

    return match(code)(
      is | 0               = "clear sky",
      is | 1               = "mainly clear",
      is | 2               = "partly cloudy",
      is | 3               = "overcast",
      is | or_(45, 48)     = "fog",
      is | between(51, 55) = "drizzle",
      is | or_(56, 57)     = "freezing drizzle",
      is | between(61, 65) = "rain",
      is | or_(66, 67)     = "freezing rain",
      is | between(71, 75) = "snow fall",
      is | 77              = "snow grains",
      is | between(80, 82) = "rain showers",
      is | or_(85, 86)     = "snow showers",
      is | 95              = "thunderstorm",
      is | between(96, 99) = "thunderstorm with hail",
      is | _               = "unknown"
    );
  }
} // namespace nimbus::services::weather::utils
