#pragma once

#include <istream> // std::istream

#include <Nimbus/Utils/Types.hpp>

#include "Event.hpp"

namespace nimbus::repl {
  namespace {
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::Unit;
  } // namespace

  /**
   * @brief Reads @p input line by line until it ends, pushing one Command per non-empty line.
   *
   * Blocks the calling thread. Finishes by pushing exactly one InputClosed event.
   * Never interprets verbs.
   */
  fn ReadInput(std::istream& input, EventChannel& channel) -> Unit;

  /**
   * @brief Runs ReadInput on a detached thread.
   * @param input Stream to read. Must outlive the thread (std::cin, or a stream the caller keeps alive
   *              until InputClosed arrives).
   * @param channel Channel shared with the dispatcher.
   * @return InternalError if the thread could not be started.
   */
  fn StartInputReader(std::istream& input, SharedPointer<EventChannel> channel) -> Result<>;
} // namespace nimbus::repl
