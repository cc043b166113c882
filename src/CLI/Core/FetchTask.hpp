#pragma once

#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Types.hpp>

#include "Event.hpp"

namespace nimbus::repl {
  namespace {
    using services::weather::IWeatherService;

    using utils::types::Result;
    using utils::types::SharedPointer;
  } // namespace

  /**
   * @brief Performs the blocking work for one request: resolve if needed, then fetch.
   *
   * Report fields the provider left empty are filled from the resolved location.
   */
  fn RunFetch(const FetchRequest& request, const IWeatherService& service, const Settings& settings) -> Result<Report>;

  /**
   * @brief Runs RunFetch on a detached thread and pushes exactly one FetchOutcome.
   *
   * The thread shares only the const service and the channel. It never retries.
   *
   * @return InternalError if the thread could not be started; nothing is pushed in that case.
   */
  fn SpawnFetch(FetchRequest request, SharedPointer<const IWeatherService> service, SharedPointer<EventChannel> channel, Settings settings) -> Result<>;
} // namespace nimbus::repl
