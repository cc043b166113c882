#include "Dispatcher.hpp"

#include <matchit.hpp> // matchit::{match, is, _}
#include <utility>     // std::move

#include <Nimbus/Utils/Logging.hpp>

#include "UI/UI.hpp"

#include "FetchTask.hpp"

using namespace nimbus::utils::types;
using nimbus::services::weather::Location;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace nimbus::repl {
  fn ConsoleSink(const StringView text) -> Unit {
    const LockGuard lock(utils::logging::GetLogMutex());
    utils::logging::Print(text);
  }

  Dispatcher::Dispatcher(SharedPointer<const IWeatherService> service, FavouritesStore favourites, Settings settings, OutputSink sink)
    : m_service(std::move(service)),
      m_channel(std::make_shared<EventChannel>()),
      m_favourites(std::move(favourites)),
      m_settings(std::move(settings)),
      m_sink(std::move(sink)) {}

  fn Dispatcher::submit(Command command) -> Unit {
    m_channel->push(std::move(command));
  }

  fn Dispatcher::step() -> bool {
    return handle(m_channel->pop());
  }

  fn Dispatcher::stepFor(const std::chrono::milliseconds timeout) -> Option<bool> {
    Option<Event> event = m_channel->popFor(timeout);

    if (!event)
      return None;

    return handle(std::move(*event));
  }

  fn Dispatcher::run() -> Result<> {
    print(ui::RenderHelp());
    print(ui::PROMPT);

    bool running = true;

    while (running)
      running = step();

    if (m_inFlight > 0)
      debug_log("Abandoning {} in-flight fetch(es)", m_inFlight);

    return Err(m_closed.value_or(NimbusError(InputStreamFailure, "Input closed")));
  }

  fn Dispatcher::handle(Event event) -> bool {
    if (Command* command = std::get_if<Command>(&event)) {
      // Tokenize never yields these, but submit() accepts any Command.
      if (command->tokens.empty())
        return true;

      handleCommand(*command);
      print(ui::PROMPT);
      return true;
    }

    if (FetchOutcome* outcome = std::get_if<FetchOutcome>(&event)) {
      handleOutcome(std::move(*outcome));
      print(ui::PROMPT);
      return true;
    }

    m_closed = std::get<InputClosed>(event).error;

    return false;
  }

  fn Dispatcher::handleCommand(const Command& command) -> Unit {
    using matchit::match, matchit::is, matchit::_;

    debug_log("Handling command '{}' with {} argument(s)", command.verb(), command.tokens.size() - 1);

    // clang-format off
    match(command.verb())(
      is | "w"      = [&] { weather(command); },
      is | "f"      = [&] { fetchFavourites(); },
      is | "list"   = [&] { listFavourites(); },
      is | "fav"    = [&] { addFavourite(command); },
      is | "remove" = [&] { removeFavourite(command); },
      is | "help"   = [&] { print(ui::RenderHelp()); },
      is | _        = [&] { printError(NimbusError(InvalidArgument, "Unknown command")); }
    );
    // clang-format on
  }

  fn Dispatcher::handleOutcome(FetchOutcome outcome) -> Unit {
    if (m_inFlight > 0)
      --m_inFlight;

    const FetchRequest& request = outcome.request;

    if (request.intent == Intent::Favourite)
      if (const auto iter = m_batches.find(request.batch); iter != m_batches.end() && --iter->second == 0) {
        debug_log("Favourites batch #{} complete", request.batch);
        m_batches.erase(iter);
      }

    if (!outcome.result) {
      debug_at(outcome.result.error());
      printError(outcome.result.error(), request.subject());
      return;
    }

    print(ui::RenderReport(*outcome.result, m_settings.units));
  }

  fn Dispatcher::weather(const Command& command) -> Unit {
    Option<String> city = command.arg(0);

    if (!city) {
      printError(NimbusError(InvalidArgument, "Missing city parameter"));
      return;
    }

    spawn({
      .id     = 0,
      .intent = Intent::Direct,
      .batch  = 0,
      .target = Query { .city = std::move(*city), .country = command.arg(1).value_or("") },
    });
  }

  fn Dispatcher::fetchFavourites() -> Unit {
    if (m_favourites.empty()) {
      print(ui::RenderMessage("No favourites added"));
      return;
    }

    const u64 batch = m_nextBatch++;

    m_batches[batch] = m_favourites.size();

    // Each task gets its own copy, so later fav/remove commands cannot affect it.
    for (const Location& location : m_favourites.entries())
      spawn({ .id = 0, .intent = Intent::Favourite, .batch = batch, .target = location });
  }

  fn Dispatcher::listFavourites() -> Unit {
    print(ui::RenderFavourites(m_favourites.entries()));
  }

  fn Dispatcher::addFavourite(const Command& command) -> Unit {
    const Option<String> city = command.arg(0);

    if (!city) {
      printError(NimbusError(InvalidArgument, "Missing city parameter"));
      return;
    }

    if (m_favourites.contains(*city)) {
      printError(NimbusError(DuplicateFavourite, std::format("{} already exists in favourites", *city)));
      return;
    }

    // Resolution blocks the loop; fav is rare and the user waits for its confirmation anyway.
    Result<Location> location = m_service->resolve(*city, command.arg(1).value_or(""));

    if (!location) {
      printError(location.error(), *city);
      return;
    }

    const String confirmation = std::format("New location {}, {} added to favourites", location->city, location->country);

    if (Result res = m_favourites.add(std::move(*location)); !res) {
      printError(res.error());
      return;
    }

    if (Result res = m_favourites.save(); !res) {
      error_at(res.error());
      printError(res.error());
      return;
    }

    print(ui::RenderMessage(confirmation));
  }

  fn Dispatcher::removeFavourite(const Command& command) -> Unit {
    const Option<String> city = command.arg(0);

    if (!city) {
      printError(NimbusError(InvalidArgument, "Missing city parameter"));
      return;
    }

    Result<Location> removed = m_favourites.remove(*city);

    if (!removed) {
      printError(removed.error());
      return;
    }

    if (Result res = m_favourites.save(); !res) {
      error_at(res.error());
      printError(res.error());
      return;
    }

    print(ui::RenderMessage(std::format("City {} successfully removed from favourites", removed->city)));
  }

  fn Dispatcher::spawn(FetchRequest request) -> Unit {
    request.id = m_nextId++;

    const Intent intent  = request.intent;
    const u64    batch   = request.batch;
    const String subject = request.subject();

    if (Result res = SpawnFetch(std::move(request), m_service, m_channel, m_settings); !res) {
      printError(res.error(), subject);

      // The outcome will never arrive, so stop waiting for it.
      if (intent == Intent::Favourite)
        if (const auto iter = m_batches.find(batch); iter != m_batches.end() && --iter->second == 0)
          m_batches.erase(iter);

      return;
    }

    ++m_inFlight;
  }

  fn Dispatcher::print(const StringView text) const -> Unit {
    m_sink(text);
  }

  fn Dispatcher::printError(const NimbusError& error, const StringView subject) const -> Unit {
    m_sink(ui::RenderError(error, subject));
  }
} // namespace nimbus::repl
