#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Services/Weather/DataTransferObjects.hpp"
#include "Services/Weather/WeatherUtils.hpp"

#include "gtest/gtest.h"

using namespace nimbus::utils::types;
using namespace nimbus::services::weather;
using enum nimbus::utils::error::NimbusErrorCode;

namespace {
  constexpr glz::opts LENIENT = { .error_on_unknown_keys = false };
} // namespace

class WeatherServiceTest : public testing::Test {};

TEST_F(WeatherServiceTest, OpenWeatherMapGeocodingParses) {
  const String json = R"([
    {"name":"London","local_names":{"en":"London"},"lat":51.5073219,"lon":-0.1276474,"country":"GB","state":"England"}
  ])";

  Vec<dto::owm::GeoResult> results;

  ASSERT_EQ(glz::read<LENIENT>(results, json).ec, glz::error_code::none);
  ASSERT_EQ(results.size(), 1);
  EXPECT_EQ(results[0].name, "London");
  EXPECT_EQ(results[0].country, "GB");
  EXPECT_NEAR(results[0].lat, 51.5073, 1e-3);
  EXPECT_NEAR(results[0].lon, -0.1276, 1e-3);
}

TEST_F(WeatherServiceTest, OpenWeatherMapCurrentWeatherParses) {
  const String json = R"({
    "coord":{"lon":-0.1276,"lat":51.5073},
    "weather":[{"id":500,"main":"Rain","description":"light rain","icon":"10d"}],
    "main":{"temp":12.34,"feels_like":11.02,"temp_min":11.0,"temp_max":13.5,"pressure":1012,"humidity":81},
    "sys":{"type":2,"id":2075535,"country":"GB","sunrise":1700000000,"sunset":1700030000},
    "name":"London",
    "cod":200
  })";

  dto::owm::OWMResponse response;

  ASSERT_EQ(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
  EXPECT_DOUBLE_EQ(response.main.temp, 12.34);
  EXPECT_DOUBLE_EQ(response.main.feelsLike, 11.02);
  ASSERT_EQ(response.weather.size(), 1);
  EXPECT_EQ(response.weather[0].description, "light rain");
  EXPECT_EQ(response.name, "London");
  ASSERT_TRUE(response.sys.has_value());
  EXPECT_EQ(response.sys->country, "GB");
}

TEST_F(WeatherServiceTest, OpenWeatherMapErrorBodyParses) {
  const String json = R"({"cod":"401","message":"Invalid API key. Please see https://openweathermap.org/faq#error401 for more info."})";

  dto::owm::ErrorResponse response;

  ASSERT_EQ(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
  ASSERT_TRUE(response.message.has_value());
  EXPECT_TRUE(response.message->starts_with("Invalid API key"));
}

TEST_F(WeatherServiceTest, OpenMeteoGeocodingParses) {
  const String json = R"({
    "results":[
      {"id":2643743,"name":"London","latitude":51.50853,"longitude":-0.12574,"country_code":"GB","country":"United Kingdom"},
      {"id":6058560,"name":"London","latitude":42.98339,"longitude":-81.23304,"country_code":"CA","country":"Canada"}
    ],
    "generationtime_ms":0.5
  })";

  dto::openmeteo::GeoResponse response;

  ASSERT_EQ(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
  ASSERT_TRUE(response.results.has_value());
  ASSERT_EQ(response.results->size(), 2);
  EXPECT_EQ(response.results->at(1).countryCode, "CA");
  EXPECT_EQ(response.results->at(1).country, "Canada");
}

TEST_F(WeatherServiceTest, OpenMeteoGeocodingWithoutResults) {
  const String json = R"({"generationtime_ms":0.2})";

  dto::openmeteo::GeoResponse response;

  ASSERT_EQ(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
  EXPECT_FALSE(response.results.has_value());
}

TEST_F(WeatherServiceTest, OpenMeteoForecastParses) {
  const String json = R"({
    "latitude":51.5,"longitude":-0.12,
    "current_units":{"temperature_2m":"°C"},
    "current":{"time":"2024-01-01T12:00","interval":900,"temperature_2m":7.4,"apparent_temperature":4.9,"weather_code":61}
  })";

  dto::openmeteo::Response response;

  ASSERT_EQ(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
  EXPECT_DOUBLE_EQ(response.current.temperature2m, 7.4);
  EXPECT_DOUBLE_EQ(response.current.apparentTemperature, 4.9);
  EXPECT_EQ(response.current.weatherCode, 61);
}

TEST_F(WeatherServiceTest, MalformedPayloadIsRejected) {
  const String json = R"({"main":{"temp":"warm"}})";

  dto::owm::OWMResponse response;

  EXPECT_NE(glz::read<LENIENT>(response, json).ec, glz::error_code::none);
}

TEST_F(WeatherServiceTest, OpenMeteoWeatherDescriptions) {
  using utils::GetOpenmeteoWeatherDescription;

  EXPECT_EQ(GetOpenmeteoWeatherDescription(0), "clear sky");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(2), "partly cloudy");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(48), "fog");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(53), "drizzle");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(65), "rain");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(77), "snow grains");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(81), "rain showers");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(99), "thunderstorm with hail");
  EXPECT_EQ(GetOpenmeteoWeatherDescription(42), "unknown");
}

TEST_F(WeatherServiceTest, LocationSerializesForFavourites) {
  const Location location { .city = "Paris", .country = "FR", .coords = { .lat = 48.85, .lon = 2.35 } };

  String json;
  ASSERT_FALSE(glz::write_json(location, json));

  Location parsed {};
  ASSERT_EQ(glz::read_json(parsed, json).ec, glz::error_code::none);
  EXPECT_EQ(parsed, location);
  EXPECT_NE(json.find("\"coords\""), String::npos);
}

TEST_F(WeatherServiceTest, OpenWeatherMapRequiresApiKey) {
  Result<UniquePointer<IWeatherService>> missing = CreateWeatherService(Provider::OpenWeatherMap, None);

  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ConfigurationError);

  Result<UniquePointer<IWeatherService>> blank = CreateWeatherService(Provider::OpenWeatherMap, String {});

  ASSERT_FALSE(blank);
  EXPECT_EQ(blank.error().code, ConfigurationError);
}

TEST_F(WeatherServiceTest, FactoryBuildsEachProvider) {
  Result<UniquePointer<IWeatherService>> owm = CreateWeatherService(Provider::OpenWeatherMap, String("key"));
  ASSERT_TRUE(owm);
  EXPECT_NE(owm->get(), nullptr);

  Result<UniquePointer<IWeatherService>> openMeteo = CreateWeatherService(Provider::OpenMeteo);
  ASSERT_TRUE(openMeteo);
  EXPECT_NE(openMeteo->get(), nullptr);
}
