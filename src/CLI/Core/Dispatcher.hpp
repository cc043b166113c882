#pragma once

#include <chrono> // std::chrono::milliseconds

#include <Nimbus/Core/Favourites.hpp>
#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Event.hpp"

namespace nimbus::repl {
  namespace {
    using core::FavouritesStore;
    using services::weather::IWeatherService;

    using utils::error::NimbusError;
    using utils::types::Fn;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::StringView;
    using utils::types::u64;
    using utils::types::Unit;
    using utils::types::UnorderedMap;
    using utils::types::usize;
  } // namespace

  /**
   * @brief Receives everything the REPL prints.
   */
  using OutputSink = Fn<Unit(StringView)>;

  /**
   * @brief Writes to stdout while holding the log mutex.
   */
  fn ConsoleSink(StringView text) -> Unit;

  /**
   * @brief The REPL's control loop and the only owner of mutable state.
   *
   * Commands from the input reader and outcomes from fetch threads arrive on one
   * channel. Each call to step() handles exactly one event to completion, so the
   * favourites list and fan-out bookkeeping are never touched concurrently.
   */
  class Dispatcher {
   public:
    Dispatcher(SharedPointer<const IWeatherService> service, FavouritesStore favourites, Settings settings, OutputSink sink = ConsoleSink);

    /**
     * @brief The channel producers push to. Hand this to the input reader.
     */
    [[nodiscard]] fn channel() const -> const SharedPointer<EventChannel>& {
      return m_channel;
    }

    /**
     * @brief Queues a command as if it had been typed.
     */
    fn submit(Command command) -> Unit;

    /**
     * @brief Blocks for one event and handles it.
     * @return False once InputClosed has been handled, true otherwise.
     */
    fn step() -> bool;

    /**
     * @brief Like step(), but gives up after @p timeout.
     * @return None if no event arrived in time.
     */
    fn stepFor(std::chrono::milliseconds timeout) -> Option<bool>;

    /**
     * @brief Prints the command summary and prompt, then steps until input closes.
     * @return Always an error: InputStreamFailure describing why input ended.
     */
    fn run() -> Result<>;

    /**
     * @brief Number of fetch threads whose outcome has not been handled yet.
     */
    [[nodiscard]] fn inFlight() const -> usize {
      return m_inFlight;
    }

    /**
     * @brief Number of `f` fan-outs with outcomes still outstanding.
     */
    [[nodiscard]] fn pendingBatches() const -> usize {
      return m_batches.size();
    }

    [[nodiscard]] fn favourites() const -> const FavouritesStore& {
      return m_favourites;
    }

   private:
    fn handle(Event event) -> bool;

    fn handleCommand(const Command& command) -> Unit;
    fn handleOutcome(FetchOutcome outcome) -> Unit;

    fn weather(const Command& command) -> Unit;
    fn fetchFavourites() -> Unit;
    fn listFavourites() -> Unit;
    fn addFavourite(const Command& command) -> Unit;
    fn removeFavourite(const Command& command) -> Unit;

    fn spawn(FetchRequest request) -> Unit;
    fn print(StringView text) const -> Unit;
    fn printError(const NimbusError& error, StringView subject = {}) const -> Unit;

    SharedPointer<const IWeatherService> m_service;
    SharedPointer<EventChannel>          m_channel;
    FavouritesStore                      m_favourites;
    Settings                             m_settings;
    OutputSink                           m_sink;

    usize                    m_inFlight  = 0;
    u64                      m_nextId    = 1;
    u64                      m_nextBatch = 1;
    UnorderedMap<u64, usize> m_batches; ///< Fan-out id to outcomes still expected.
    Option<NimbusError>      m_closed;
  };
} // namespace nimbus::repl
