#include "OpenWeatherMapService.hpp"

#include <utility> // std::move

#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Logging.hpp"
#include "Nimbus/Utils/Types.hpp"

#include "DataTransferObjects.hpp"
#include "WeatherUtils.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using nimbus::utils::error::NimbusErrorCode;
using enum nimbus::utils::error::NimbusErrorCode;
using nimbus::services::weather::Coords;
using nimbus::services::weather::Location;
using nimbus::services::weather::OpenWeatherMapService;
using nimbus::services::weather::Report;
using nimbus::services::weather::UnitSystem;
using nimbus::services::weather::utils::HttpGet;
using nimbus::services::weather::utils::HttpResponse;

namespace {
  constexpr PCStr GEOCODING_URL = "https://api.openweathermap.org/geo/1.0/direct";
  constexpr PCStr WEATHER_URL   = "https://api.openweathermap.org/data/2.5/weather";

  // Turns a non-2xx response into an error, using the API's "message" field when it sent one.
  fn ApiError(const HttpResponse& response, const NimbusErrorCode notFoundCode) -> NimbusError {
    using matchit::match, matchit::is, matchit::_;
    using glz::read, glz::error_code;

    nimbus::services::weather::dto::owm::ErrorResponse body;

    String apiErrorMessage = std::format("OpenWeatherMap API error (HTTP {})", response.status);

    if (read<glz::opts { .error_on_unknown_keys = false }>(body, response.body).ec == error_code::none && body.message && !body.message->empty())
      apiErrorMessage += std::format(": {}", *body.message);

    return { match(response.status)(is | 401 = PermissionDenied, is | 404 = notFoundCode, is | _ = ApiUnavailable), apiErrorMessage };
  }

  template <typename T>
  fn ParseBody(const HttpResponse& response) -> Result<T> {
    using glz::error_ctx, glz::read, glz::error_code;

    T value {};

    if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(value, response.body); errc.ec != error_code::none)
      ERR_FMT(ParseError, "Failed to parse JSON response: {}", format_error(errc, response.body));

    return value;
  }
} // namespace

OpenWeatherMapService::OpenWeatherMapService(String apiKey)
  : m_apiKey(std::move(apiKey)) {}

fn OpenWeatherMapService::resolve(const String& city, const String& country) const -> Result<Location> {
  using nimbus::services::weather::dto::owm::GeoResult;

  const String query = country.empty() ? city : std::format("{},{}", city, country);

  Result<String> escapedQuery = utils::EscapeQuery(query);
  if (!escapedQuery)
    return Err(escapedQuery.error());

  Result<String> escapedKey = utils::EscapeQuery(m_apiKey);
  if (!escapedKey)
    return Err(escapedKey.error());

  Result<HttpResponse> response = HttpGet(std::format("{}?q={}&limit=1&appid={}", GEOCODING_URL, *escapedQuery, *escapedKey));
  if (!response)
    return Err(response.error());

  if (response->status < 200 || response->status >= 300)
    return Err(ApiError(*response, LocationNotFound));

  Result<Vec<GeoResult>> results = ParseBody<Vec<GeoResult>>(*response);
  if (!results)
    return Err(results.error());

  if (results->empty())
    ERR_FMT(LocationNotFound, "No location found for '{}'", query);

  GeoResult& match = results->front();

  debug_log("Resolved '{}' to {}, {} ({:.4f}, {:.4f})", query, match.name, match.country, match.lat, match.lon);

  return Location {
    .city    = std::move(match.name),
    .country = std::move(match.country),
    .coords  = { .lat = match.lat, .lon = match.lon },
  };
}

fn OpenWeatherMapService::fetchWeather(const Coords& coords, const String& language, const UnitSystem units) const -> Result<Report> {
  using nimbus::services::weather::dto::owm::OWMResponse;

  Result<String> escapedLang = utils::EscapeQuery(language);
  if (!escapedLang)
    return Err(escapedLang.error());

  Result<String> escapedKey = utils::EscapeQuery(m_apiKey);
  if (!escapedKey)
    return Err(escapedKey.error());

  const String url = std::format("{}?lat={:.4f}&lon={:.4f}&units={}&lang={}&appid={}", WEATHER_URL, coords.lat, coords.lon, units, *escapedLang, *escapedKey);

  Result<HttpResponse> response = HttpGet(url);
  if (!response)
    return Err(response.error());

  if (response->status < 200 || response->status >= 300)
    return Err(ApiError(*response, WeatherUnavailable));

  Result<OWMResponse> owmResponse = ParseBody<OWMResponse>(*response);
  if (!owmResponse)
    return Err(owmResponse.error());

  if (owmResponse->weather.empty())
    ERR_FMT(WeatherUnavailable, "No weather conditions reported for ({:.4f}, {:.4f})", coords.lat, coords.lon);

  return Report {
    .city        = std::move(owmResponse->name),
    .country     = owmResponse->sys ? std::move(owmResponse->sys->country) : String {},
    .temperature = owmResponse->main.temp,
    .feelsLike   = owmResponse->main.feelsLike,
    .description = std::move(owmResponse->weather.front().description),
  };
}
