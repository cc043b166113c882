#include <cstdlib>                   // EXIT_FAILURE
#include <iostream>                  // std::cin
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <utility>                   // std::move

#include <Nimbus/Core/Favourites.hpp>
#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/Dispatcher.hpp"
#include "Core/InputReader.hpp"
#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;
using namespace nimbus::config;

fn main() -> i32 try {
  using nimbus::core::FavouritesStore;
  using nimbus::repl::Dispatcher;
  using nimbus::repl::Settings;
  using nimbus::services::weather::CreateWeatherService;
  using nimbus::services::weather::IWeatherService;

  Result<Config> config = Config::load();

  if (!config) {
    error_at(config.error());
    return EXIT_FAILURE;
  }

  SetRuntimeLogLevel(config->general.logLevel);

  debug_log("Provider: {}, units: {}, language: {}", magic_enum::enum_name(config->weather.provider), config->general.units, config->general.language);

  if (Result res = Curl::GlobalInit(); !res) {
    error_at(res.error());
    return EXIT_FAILURE;
  }

  Result<UniquePointer<IWeatherService>> service = CreateWeatherService(config->weather.provider, config->weather.apiKey);

  if (!service) {
    error_at(service.error());
    return EXIT_FAILURE;
  }

  FavouritesStore favourites(config->favourites.path);

  if (Result res = favourites.load(); !res) {
    error_at(res.error());
    return EXIT_FAILURE;
  }

  Dispatcher dispatcher(
    SharedPointer<const IWeatherService>(std::move(*service)),
    std::move(favourites),
    Settings { .language = config->general.language, .units = config->general.units }
  );

  if (Result res = nimbus::repl::StartInputReader(std::cin, dispatcher.channel()); !res) {
    error_at(res.error());
    return EXIT_FAILURE;
  }

  if (Result res = dispatcher.run(); !res) {
    error_at(res.error());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
