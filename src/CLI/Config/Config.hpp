#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Definitions.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::config {
  namespace {
    using services::weather::Provider;
    using services::weather::UnitSystem;
    using utils::logging::LogLevel;

    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
  } // namespace

  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    String     language = "en";                ///< Language code passed to the weather provider.
    UnitSystem units    = UnitSystem::Metric;  ///< Units for temperature, either "metric" or "imperial".
    LogLevel   logLevel = LogLevel::Info;      ///< Minimum level written to stderr.

    /**
     * @brief Parses a TOML table to create a General instance.
     * @param tbl The TOML table to parse, containing [general].
     * @return A General instance, or ConfigurationError on an unknown units or log level value.
     */
    static fn fromToml(const toml::table& tbl) -> Result<General>;
  };

  /**
   * @struct Weather
   * @brief Holds configuration settings for the weather provider.
   */
  struct Weather {
    Provider       provider = Provider::OpenWeatherMap; ///< Which provider answers lookups.
    Option<String> apiKey   = None;                     ///< API key for the provider, if it needs one.

    /**
     * @brief Parses a TOML table to create a Weather instance.
     * @param tbl The TOML table to parse, containing [weather].
     * @return A Weather instance, or ConfigurationError on an unknown provider.
     */
    static fn fromToml(const toml::table& tbl) -> Result<Weather>;
  };

  /**
   * @struct Favourites
   * @brief Where the favourites list is persisted.
   */
  struct Favourites {
    std::filesystem::path path; ///< Favourites file; empty means favourites.json beside the config file.

    static fn fromToml(const toml::table& tbl) -> Favourites {
      return { .path = std::filesystem::path(tbl["path"].value_or(String {})) };
    }
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General    general;    ///< General configuration settings.
    Weather    weather;    ///< Weather provider settings.
    Favourites favourites; ///< Favourites file settings.

    /**
     * @brief Builds a Config from a parsed TOML document.
     * @param tbl The TOML table containing [general], [weather] and [favourites].
     * @param configDir Directory of the config file, used to place the default favourites file.
     * @return The configuration, or ConfigurationError.
     */
    static fn fromToml(const toml::table& tbl, const std::filesystem::path& configDir) -> Result<Config>;

    /**
     * @brief Retrieves the path to the configuration file.
     * @return The first existing candidate, or the preferred location if none exists.
     *
     * Candidates, in order: $XDG_CONFIG_HOME/nimbus, $HOME/.config/nimbus,
     * $HOME/.nimbus and the working directory.
     */
    static fn getConfigPath() -> std::filesystem::path;

    /**
     * @brief Loads the configuration, writing a default file first if none exists.
     * @return The configuration, or the error that prevented reading it.
     */
    static fn load() -> Result<Config>;
  };
} // namespace nimbus::config
