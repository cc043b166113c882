#pragma once

#include <format>                // std::formatter
#include <glaze/core/common.hpp> // object
#include <glaze/core/meta.hpp>   // Object
#include <matchit.hpp>           // matchit::{match, is}

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::weather {
  namespace {
    using nimbus::utils::types::f64;
    using nimbus::utils::types::None;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::u8;
    using nimbus::utils::types::UniquePointer;
  } // namespace

  /**
   * @brief Specifies the weather service provider.
   */
  enum class Provider : u8 {
    OpenWeatherMap, ///< OpenWeatherMap API. Requires an API key.
    OpenMeteo,      ///< Open-Meteo API. Does not require an API key.
  };

  /**
   * @brief Specifies the unit system for weather information.
   */
  enum class UnitSystem : u8 {
    Metric,   ///< Metric units (Celsius, m/s).
    Imperial, ///< Imperial units (Fahrenheit, mph).
  };

  struct Coords {
    f64 lat;
    f64 lon;

    fn operator==(const Coords&) const -> bool = default;
  };

  /**
   * @struct Location
   * @brief A resolved place: the names the geocoder reported plus its coordinates.
   */
  struct Location {
    String city;
    String country;
    Coords coords;

    fn operator==(const Location&) const -> bool = default;
  };

  /**
   * @struct Report
   * @brief Represents a weather report for one location.
   */
  struct Report {
    String city;        ///< City name (may be empty if the provider doesn't report one)
    String country;     ///< Country code (may be empty if the provider doesn't report one)
    f64    temperature; ///< Degrees (C/F)
    f64    feelsLike;   ///< Apparent temperature, degrees (C/F)
    String description; ///< Weather description (e.g., "clear sky", "rain")
  };

  /**
   * @brief Geocoding and current-weather lookups against one provider.
   *
   * Implementations hold no mutable state and may be called from several
   * threads at once.
   */
  class IWeatherService {
   public:
    IWeatherService(const IWeatherService&) = delete;
    IWeatherService(IWeatherService&&)      = delete;

    fn operator=(const IWeatherService&)->IWeatherService& = delete;
    fn operator=(IWeatherService&&)->IWeatherService&      = delete;

    virtual ~IWeatherService() = default;

    /**
     * @brief Resolves a city (optionally narrowed by country) to a Location.
     * @param city The city name as typed by the user.
     * @param country Country name or ISO code; empty to accept any country.
     * @return The best match, or LocationNotFound.
     */
    [[nodiscard]] virtual fn resolve(const String& city, const String& country) const -> Result<Location> = 0;

    /**
     * @brief Fetches current weather at the given coordinates.
     * @param coords Where to fetch weather for.
     * @param language Language code for the description, where the provider supports one.
     * @param units Unit system for temperatures.
     * @return The report, or WeatherUnavailable / a transport error.
     */
    [[nodiscard]] virtual fn fetchWeather(const Coords& coords, const String& language, UnitSystem units) const -> Result<Report> = 0;

   protected:
    IWeatherService() = default;
  };

  fn CreateWeatherService(Provider provider, const Option<String>& apiKey = None) -> Result<UniquePointer<IWeatherService>>;
} // namespace nimbus::services::weather

template <>
struct glz::meta<nimbus::services::weather::Coords> {
  using T = nimbus::services::weather::Coords;

  static constexpr detail::Object value = object("lat", &T::lat, "lon", &T::lon);
};

template <>
struct glz::meta<nimbus::services::weather::Location> {
  using T = nimbus::services::weather::Location;

  // clang-format off
  static constexpr detail::Object value = object(
    "city",    &T::city,
    "country", &T::country,
    "coords",  &T::coords
  );
  // clang-format on
};

template <>
struct std::formatter<nimbus::services::weather::UnitSystem> {
  static constexpr auto parse(std::format_parse_context& ctx) {
    return ctx.begin();
  }

  static fn format(nimbus::services::weather::UnitSystem unit, std::format_context& ctx) {
    using matchit::match, matchit::is;

    return std::format_to(ctx.out(), "{}", match(unit)(is | nimbus::services::weather::UnitSystem::Metric = "metric", is | nimbus::services::weather::UnitSystem::Imperial = "imperial"));
  }
};
