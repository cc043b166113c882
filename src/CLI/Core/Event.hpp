#pragma once

#include <variant> // std::variant

#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Channel.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Command.hpp"

namespace nimbus::repl {
  namespace {
    using services::weather::Location;
    using services::weather::Report;
    using services::weather::UnitSystem;

    using utils::error::NimbusError;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u64;
    using utils::types::u8;
  } // namespace

  /**
   * @brief Language and unit settings every fetch is made with.
   */
  struct Settings {
    String     language = "en";
    UnitSystem units    = UnitSystem::Metric;
  };

  /**
   * @brief A city/country pair that still has to be geocoded.
   */
  struct Query {
    String city;
    String country;
  };

  enum class Intent : u8 {
    Direct,    ///< A single `w` lookup.
    Favourite, ///< One member of an `f` fan-out.
  };

  /**
   * @struct FetchRequest
   * @brief One unit of background work and the reason it was started.
   */
  struct FetchRequest {
    u64                           id     = 0;
    Intent                        intent = Intent::Direct;
    u64                           batch  = 0; ///< Fan-out id; only meaningful for Intent::Favourite.
    std::variant<Query, Location> target;     ///< Either resolve first, or coordinates already known.

    /**
     * @brief The city this request is about, as the user typed or stored it.
     */
    [[nodiscard]] fn subject() const -> const String& {
      return std::holds_alternative<Query>(target) ? std::get<Query>(target).city : std::get<Location>(target).city;
    }
  };

  /**
   * @struct FetchOutcome
   * @brief The single result of a FetchRequest. Success and failure share one type.
   */
  struct FetchOutcome {
    FetchRequest   request;
    Result<Report> result;
  };

  /**
   * @struct InputClosed
   * @brief Sent once by the input reader when its stream ends or fails.
   */
  struct InputClosed {
    NimbusError error;
  };

  using Event        = std::variant<Command, FetchOutcome, InputClosed>;
  using EventChannel = utils::sync::Channel<Event>;
} // namespace nimbus::repl
