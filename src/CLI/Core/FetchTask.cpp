#include "FetchTask.hpp"

#include <system_error> // std::system_error
#include <thread>       // std::thread
#include <utility>      // std::move

#include <Nimbus/Utils/Logging.hpp>

using namespace nimbus::utils::types;
using nimbus::services::weather::Location;
using enum nimbus::utils::error::NimbusErrorCode;

namespace nimbus::repl {
  fn RunFetch(const FetchRequest& request, const IWeatherService& service, const Settings& settings) -> Result<Report> {
    Location location;

    if (const Query* query = std::get_if<Query>(&request.target)) {
      Result<Location> resolved = service.resolve(query->city, query->country);
      if (!resolved)
        return Err(resolved.error());

      location = std::move(*resolved);
    } else
      location = std::get<Location>(request.target);

    Result<Report> report = service.fetchWeather(location.coords, settings.language, settings.units);
    if (!report)
      return Err(report.error());

    if (report->city.empty())
      report->city = location.city;

    if (report->country.empty())
      report->country = location.country;

    return report;
  }

  fn SpawnFetch(FetchRequest request, SharedPointer<const IWeatherService> service, SharedPointer<EventChannel> channel, Settings settings) -> Result<> {
    debug_log("Starting fetch #{} for '{}'", request.id, request.subject());

    try {
      std::thread([request = std::move(request), service = std::move(service), channel = std::move(channel), settings = std::move(settings)]() mutable {
        Result<Report> result = RunFetch(request, *service, settings);

        channel->push(FetchOutcome { .request = std::move(request), .result = std::move(result) });
      }).detach();
    } catch (const std::system_error& err) {
      ERR_FMT(InternalError, "Failed to start fetch thread: {}", err.what());
    }

    return {};
  }
} // namespace nimbus::repl
