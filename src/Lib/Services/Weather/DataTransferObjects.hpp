#pragma once

// clang-format off
// we need glaze.hpp include before any other includes that might use it
// because core/meta.hpp complains about not having uint8_t defined otherwise
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include "Nimbus/Utils/Types.hpp"
// clang-format on

namespace nimbus::services::weather::dto {
  // OpenWeatherMap Data Transfer Objects
  namespace owm {
    struct GeoResult {
      nimbus::utils::types::String name;
      nimbus::utils::types::f64    lat;
      nimbus::utils::types::f64    lon;
      nimbus::utils::types::String country;
    };

    struct OWMResponse {
      struct Main {
        nimbus::utils::types::f64 temp;
        nimbus::utils::types::f64 feelsLike;
      };

      struct Weather {
        nimbus::utils::types::String description;
      };

      struct Sys {
        nimbus::utils::types::String country;
      };

      Main                               main;
      nimbus::utils::types::Vec<Weather> weather;
      nimbus::utils::types::String       name;
      nimbus::utils::types::Option<Sys>  sys;
    };

    // Error bodies carry "cod" as a string on some endpoints and a number on others, so it is left unmapped.
    struct ErrorResponse {
      nimbus::utils::types::Option<nimbus::utils::types::String> message;
    };
  } // namespace owm

  // OpenMeteo Data Transfer Objects
  namespace openmeteo {
    struct GeoResult {
      nimbus::utils::types::String                               name;
      nimbus::utils::types::f64                                  latitude;
      nimbus::utils::types::f64                                  longitude;
      nimbus::utils::types::Option<nimbus::utils::types::String> countryCode;
      nimbus::utils::types::Option<nimbus::utils::types::String> country;
    };

    struct GeoResponse {
      nimbus::utils::types::Option<nimbus::utils::types::Vec<GeoResult>> results;
    };

    struct Response {
      struct Current {
        nimbus::utils::types::f64 temperature2m;
        nimbus::utils::types::f64 apparentTemperature;
        nimbus::utils::types::i32 weatherCode;
      } current;
    };

    struct ErrorResponse {
      nimbus::utils::types::Option<nimbus::utils::types::String> reason;
    };
  } // namespace openmeteo
} // namespace nimbus::services::weather::dto

namespace glz {
  // OpenWeatherMap Glaze meta definitions
  template <>
  struct meta<nimbus::services::weather::dto::owm::GeoResult> {
    using T = nimbus::services::weather::dto::owm::GeoResult;

    static constexpr detail::Object value = object("name", &T::name, "lat", &T::lat, "lon", &T::lon, "country", &T::country);
  };

  template <>
  struct meta<nimbus::services::weather::dto::owm::OWMResponse::Main> {
    using T = nimbus::services::weather::dto::owm::OWMResponse::Main;

    static constexpr detail::Object value = object("temp", &T::temp, "feels_like", &T::feelsLike);
  };

  template <>
  struct meta<nimbus::services::weather::dto::owm::OWMResponse::Weather> {
    static constexpr detail::Object value = object("description", &nimbus::services::weather::dto::owm::OWMResponse::Weather::description);
  };

  template <>
  struct meta<nimbus::services::weather::dto::owm::OWMResponse::Sys> {
    static constexpr detail::Object value = object("country", &nimbus::services::weather::dto::owm::OWMResponse::Sys::country);
  };

  template <>
  struct meta<nimbus::services::weather::dto::owm::OWMResponse> {
    using T = nimbus::services::weather::dto::owm::OWMResponse;

    static constexpr detail::Object value = object("main", &T::main, "weather", &T::weather, "name", &T::name, "sys", &T::sys);
  };

  template <>
  struct meta<nimbus::services::weather::dto::owm::ErrorResponse> {
    static constexpr detail::Object value = object("message", &nimbus::services::weather::dto::owm::ErrorResponse::message);
  };

  // OpenMeteo Glaze meta definitions
  template <>
  struct meta<nimbus::services::weather::dto::openmeteo::GeoResult> {
    using T = nimbus::services::weather::dto::openmeteo::GeoResult;

    // clang-format off
    static constexpr detail::Object value = object(
      "name",         &T::name,
      "latitude",     &T::latitude,
      "longitude",    &T::longitude,
      "country_code", &T::countryCode,
      "country",      &T::country
    );
    // clang-format on
  };

  template <>
  struct meta<nimbus::services::weather::dto::openmeteo::GeoResponse> {
    static constexpr detail::Object value = object("results", &nimbus::services::weather::dto::openmeteo::GeoResponse::results);
  };

  template <>
  struct meta<nimbus::services::weather::dto::openmeteo::Response::Current> {
    using T = nimbus::services::weather::dto::openmeteo::Response::Current;

    static constexpr detail::Object value = object("temperature_2m", &T::temperature2m, "apparent_temperature", &T::apparentTemperature, "weather_code", &T::weatherCode);
  };

  template <>
  struct meta<nimbus::services::weather::dto::openmeteo::Response> {
    static constexpr detail::Object value = object("current", &nimbus::services::weather::dto::openmeteo::Response::current);
  };

  template <>
  struct meta<nimbus::services::weather::dto::openmeteo::ErrorResponse> {
    static constexpr detail::Object value = object("reason", &nimbus::services::weather::dto::openmeteo::ErrorResponse::reason);
  };
} // namespace glz
