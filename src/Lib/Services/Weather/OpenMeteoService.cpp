#include "OpenMeteoService.hpp"

#include <algorithm> // std::ranges::find_if

#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Logging.hpp"
#include "Nimbus/Utils/Strings.hpp"
#include "Nimbus/Utils/Types.hpp"

#include "DataTransferObjects.hpp"
#include "WeatherUtils.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using nimbus::services::weather::Coords;
using nimbus::services::weather::Location;
using nimbus::services::weather::OpenMeteoService;
using nimbus::services::weather::Report;
using nimbus::services::weather::UnitSystem;
using nimbus::services::weather::utils::HttpGet;
using nimbus::services::weather::utils::HttpResponse;
using nimbus::utils::strings::StrEqualsIgnoreCase;

namespace {
  constexpr PCStr GEOCODING_URL = "https://geocoding-api.open-meteo.com/v1/search";
  constexpr PCStr FORECAST_URL  = "https://api.open-meteo.com/v1/forecast";

  // The geocoder returns several candidates; ten is enough to find the right country among namesakes.
  constexpr i32 GEOCODING_CANDIDATES = 10;

  template <typename T>
  fn ParseBody(const HttpResponse& response) -> Result<T> {
    using glz::error_ctx, glz::read, glz::error_code;

    if (response.status < 200 || response.status >= 300) {
      nimbus::services::weather::dto::openmeteo::ErrorResponse body;

      if (read<glz::opts { .error_on_unknown_keys = false }>(body, response.body).ec == error_code::none && body.reason)
        ERR_FMT(ApiUnavailable, "Open-Meteo API error (HTTP {}): {}", response.status, *body.reason);

      ERR_FMT(ApiUnavailable, "Open-Meteo API error (HTTP {})", response.status);
    }

    T value {};

    if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(value, response.body); errc.ec != error_code::none)
      ERR_FMT(ParseError, "Failed to parse JSON response: {}", format_error(errc, response.body));

    return value;
  }
} // namespace

fn OpenMeteoService::resolve(const String& city, const String& country) const -> Result<Location> {
  using nimbus::services::weather::dto::openmeteo::GeoResponse;
  using nimbus::services::weather::dto::openmeteo::GeoResult;

  Result<String> escapedCity = utils::EscapeQuery(city);
  if (!escapedCity)
    return Err(escapedCity.error());

  Result<HttpResponse> response = HttpGet(std::format("{}?name={}&count={}&format=json", GEOCODING_URL, *escapedCity, GEOCODING_CANDIDATES));
  if (!response)
    return Err(response.error());

  Result<GeoResponse> geo = ParseBody<GeoResponse>(*response);
  if (!geo)
    return Err(geo.error());

  if (!geo->results || geo->results->empty())
    ERR_FMT(LocationNotFound, "No location found for '{}'", city);

  Vec<GeoResult>& candidates = *geo->results;

  auto match = candidates.begin();

  if (!country.empty()) {
    match = std::ranges::find_if(candidates, [&country](const GeoResult& candidate) {
      return (candidate.countryCode && StrEqualsIgnoreCase(*candidate.countryCode, country)) ||
        (candidate.country && StrEqualsIgnoreCase(*candidate.country, country));
    });

    if (match == candidates.end())
      ERR_FMT(LocationNotFound, "No location found for '{}' in '{}'", city, country);
  }

  debug_log("Resolved '{}' to {} ({:.4f}, {:.4f})", city, match->name, match->latitude, match->longitude);

  return Location {
    .city    = std::move(match->name),
    .country = match->countryCode.value_or(match->country.value_or("")),
    .coords  = { .lat = match->latitude, .lon = match->longitude },
  };
}

fn OpenMeteoService::fetchWeather(const Coords& coords, const String& /*language*/, const UnitSystem units) const -> Result<Report> {
  using nimbus::services::weather::dto::openmeteo::Response;

  const String url = std::format(
    "{}?latitude={:.4f}&longitude={:.4f}&current=temperature_2m,apparent_temperature,weather_code&temperature_unit={}",
    FORECAST_URL,
    coords.lat,
    coords.lon,
    units == UnitSystem::Imperial ? "fahrenheit" : "celsius"
  );

  Result<HttpResponse> response = HttpGet(url);
  if (!response)
    return Err(response.error());

  Result<Response> apiResp = ParseBody<Response>(*response);
  if (!apiResp)
    return Err(apiResp.error());

  // Open-Meteo reports coordinates only; the caller fills in the names it resolved.
  return Report {
    .city        = {},
    .country     = {},
    .temperature = apiResp->current.temperature2m,
    .feelsLike   = apiResp->current.apparentTemperature,
    .description = utils::GetOpenmeteoWeatherDescription(apiResp->current.weatherCode),
  };
}
