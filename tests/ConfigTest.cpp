#include <cstdlib>       // setenv, unsetenv
#include <toml++/toml.h> // toml::{parse_result, parse}

#include <Nimbus/Utils/Types.hpp>

#include "Config/Config.hpp"

#include "gtest/gtest.h"

using namespace nimbus::config;
using nimbus::services::weather::Provider;
using nimbus::services::weather::UnitSystem;
using nimbus::utils::logging::LogLevel;
using nimbus::utils::types::Result;
using enum nimbus::utils::error::NimbusErrorCode;

class ConfigTest : public testing::Test {};

TEST_F(ConfigTest, GeneralFromToml_Defaults) {
  toml::parse_result tbl = toml::parse(R"(
    # Nothing set
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<General> generalConfig = General::fromToml(*tbl.as_table());

  ASSERT_TRUE(generalConfig);
  EXPECT_EQ(generalConfig->language, "en");
  EXPECT_EQ(generalConfig->units, UnitSystem::Metric);
  EXPECT_EQ(generalConfig->logLevel, LogLevel::Info);
}

TEST_F(ConfigTest, GeneralFromToml_AllValues) {
  toml::parse_result tbl = toml::parse(R"(
    language  = "de"
    units     = "imperial"
    log_level = "DEBUG"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<General> generalConfig = General::fromToml(*tbl.as_table());

  ASSERT_TRUE(generalConfig);
  EXPECT_EQ(generalConfig->language, "de");
  EXPECT_EQ(generalConfig->units, UnitSystem::Imperial);
  EXPECT_EQ(generalConfig->logLevel, LogLevel::Debug);
}

TEST_F(ConfigTest, GeneralFromToml_InvalidUnits) {
  toml::parse_result tbl = toml::parse(R"(
    units = "kelvin"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<General> generalConfig = General::fromToml(*tbl.as_table());

  ASSERT_FALSE(generalConfig);
  EXPECT_EQ(generalConfig.error().code, ConfigurationError);
}

TEST_F(ConfigTest, WeatherFromToml_OpenMeteo) {
  toml::parse_result tbl = toml::parse(R"(
    provider = "openmeteo"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Weather> weatherConfig = Weather::fromToml(*tbl.as_table());

  ASSERT_TRUE(weatherConfig);
  EXPECT_EQ(weatherConfig->provider, Provider::OpenMeteo);
}

TEST_F(ConfigTest, WeatherFromToml_ApiKeyFromFile) {
  toml::parse_result tbl = toml::parse(R"(
    provider = "openweathermap"
    api_key  = "abc123"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Weather> weatherConfig = Weather::fromToml(*tbl.as_table());

  ASSERT_TRUE(weatherConfig);
  EXPECT_EQ(weatherConfig->provider, Provider::OpenWeatherMap);
  EXPECT_EQ(weatherConfig->apiKey, "abc123");
}

#ifndef _WIN32
TEST_F(ConfigTest, WeatherFromToml_ApiKeyFromEnvironment) {
  setenv("NIMBUS_API_KEY", "from-env", 1);

  toml::parse_result tbl = toml::parse(R"(
    api_key = ""
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Weather> weatherConfig = Weather::fromToml(*tbl.as_table());

  unsetenv("NIMBUS_API_KEY");

  ASSERT_TRUE(weatherConfig);
  EXPECT_EQ(weatherConfig->apiKey, "from-env");
}
#endif

TEST_F(ConfigTest, WeatherFromToml_UnknownProvider) {
  toml::parse_result tbl = toml::parse(R"(
    provider = "metno"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Weather> weatherConfig = Weather::fromToml(*tbl.as_table());

  ASSERT_FALSE(weatherConfig);
  EXPECT_EQ(weatherConfig.error().code, ConfigurationError);
}

TEST_F(ConfigTest, ConfigFromToml_DefaultFavouritesBesideConfig) {
  toml::parse_result tbl = toml::parse(R"(
    [general]
    units = "metric"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Config> config = Config::fromToml(*tbl.as_table(), "/tmp/nimbus");

  ASSERT_TRUE(config);
  EXPECT_EQ(config->favourites.path, std::filesystem::path("/tmp/nimbus/favourites.json"));
}

TEST_F(ConfigTest, ConfigFromToml_ExplicitFavouritesPath) {
  toml::parse_result tbl = toml::parse(R"(
    [favourites]
    path = "/var/lib/nimbus/favs.json"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Config> config = Config::fromToml(*tbl.as_table(), "/tmp/nimbus");

  ASSERT_TRUE(config);
  EXPECT_EQ(config->favourites.path, std::filesystem::path("/var/lib/nimbus/favs.json"));
}

TEST_F(ConfigTest, ConfigFromToml_InvalidSectionPropagates) {
  toml::parse_result tbl = toml::parse(R"(
    [general]
    log_level = "verbose"
  )");

  ASSERT_TRUE(tbl.is_table());
  Result<Config> config = Config::fromToml(*tbl.as_table(), ".");

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigurationError);
}
