#include "Config.hpp"

#include <fstream>                   // std::ofstream
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <system_error>              // std::error_code
#include <toml++/impl/parser.hpp>    // toml::{parse_file, parse_error}

#include <Nimbus/Utils/Env.hpp>

namespace fs = std::filesystem;

using namespace nimbus::utils::types;
using nimbus::utils::env::GetEnv;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace {
  constexpr PCStr DEFAULT_CONFIG = R"toml(# Nimbus Configuration File

[general]
language  = "en"      # Language code for weather descriptions
units     = "metric"  # "metric" or "imperial"
log_level = "info"    # "debug", "info", "warn" or "error"

[weather]
provider = "openweathermap" # "openweathermap" or "openmeteo"
api_key  = ""               # Required for openweathermap; falls back to $NIMBUS_API_KEY, then $API_KEY

[favourites]
path = "" # Defaults to favourites.json next to this file
)toml";

  // Parses a string setting into an enum, case-insensitively.
  template <typename EnumType>
  fn ParseEnum(const toml::table& tbl, const StringView key, const EnumType fallback) -> Result<EnumType> {
    const Option<String> raw = tbl[key].value<String>();

    if (!raw)
      return fallback;

    if (const Option<EnumType> parsed = magic_enum::enum_cast<EnumType>(*raw, magic_enum::case_insensitive))
      return *parsed;

    ERR_FMT(ConfigurationError, "Invalid value '{}' for '{}'", *raw, key);
  }

  fn CreateDefaultConfig(const fs::path& configPath) -> Result<> {
    std::error_code errc;

    if (configPath.has_parent_path()) {
      fs::create_directories(configPath.parent_path(), errc);

      if (errc)
        ERR_FMT(ConfigurationError, "Failed to create config directory: {}", errc.message());
    }

    std::ofstream file(configPath);
    if (!file.is_open())
      ERR_FMT(ConfigurationError, "Failed to create config file: {}", configPath.string());

    file << DEFAULT_CONFIG;

    if (!file)
      ERR_FMT(ConfigurationError, "Failed to write config file: {}", configPath.string());

    info_log("Created default config file at {}", configPath.string());

    return {};
  }
} // namespace

namespace nimbus::config {
  fn General::fromToml(const toml::table& tbl) -> Result<General> {
    General gen;

    if (const Option<String> language = tbl["language"].value<String>(); language && !language->empty())
      gen.language = *language;

    Result<UnitSystem> units = ParseEnum(tbl, "units", gen.units);
    if (!units)
      return Err(units.error());

    Result<LogLevel> level = ParseEnum(tbl, "log_level", gen.logLevel);
    if (!level)
      return Err(level.error());

    gen.units    = *units;
    gen.logLevel = *level;

    return gen;
  }

  fn Weather::fromToml(const toml::table& tbl) -> Result<Weather> {
    Weather weather;

    Result<Provider> provider = ParseEnum(tbl, "provider", weather.provider);
    if (!provider)
      return Err(provider.error());

    weather.provider = *provider;

    if (const Option<String> key = tbl["api_key"].value<String>(); key && !key->empty())
      weather.apiKey = *key;
    else if (Result<String> envKey = GetEnv("NIMBUS_API_KEY"))
      weather.apiKey = *envKey;
    else if (Result<String> legacyKey = GetEnv("API_KEY"))
      weather.apiKey = *legacyKey;

    return weather;
  }

  fn Config::fromToml(const toml::table& tbl, const fs::path& configDir) -> Result<Config> {
    Config cfg;

    if (const toml::node_view genTbl = tbl["general"]; genTbl.is_table()) {
      Result<General> general = General::fromToml(*genTbl.as_table());
      if (!general)
        return Err(general.error());

      cfg.general = *general;
    }

    // Defaults still consult the environment for the API key.
    const toml::table     emptyTbl;
    const toml::node_view weatherTbl = tbl["weather"];

    Result<Weather> weather = Weather::fromToml(weatherTbl.is_table() ? *weatherTbl.as_table() : emptyTbl);
    if (!weather)
      return Err(weather.error());

    cfg.weather = *weather;

    if (const toml::node_view favTbl = tbl["favourites"]; favTbl.is_table())
      cfg.favourites = Favourites::fromToml(*favTbl.as_table());

    if (cfg.favourites.path.empty())
      cfg.favourites.path = configDir / "favourites.json";

    return cfg;
  }

  fn Config::getConfigPath() -> fs::path {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "nimbus" / "config.toml");

    if (Result<String> result = GetEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "nimbus" / "config.toml");
      possiblePaths.emplace_back(fs::path(*result) / ".nimbus" / "config.toml");
    }

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  fn Config::load() -> Result<Config> {
    const fs::path configPath = getConfigPath();

    if (std::error_code errc; !fs::exists(configPath, errc)) {
      info_log("Config file not found at {}, creating defaults.", configPath.string());

      if (Result res = CreateDefaultConfig(configPath); !res)
        return Err(res.error());
    }

    try {
      const toml::table parsedConfig = toml::parse_file(configPath.string());

      debug_log("Config loaded from {}", configPath.string());

      return fromToml(parsedConfig, configPath.parent_path());
    } catch (const toml::parse_error& err) {
      ERR_FMT(ConfigurationError, "Failed to parse {}: {}", configPath.string(), err.description());
    }
  }
} // namespace nimbus::config
