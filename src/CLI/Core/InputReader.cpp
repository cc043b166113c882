#include "InputReader.hpp"

#include <string>       // std::getline
#include <system_error> // std::system_error
#include <thread>       // std::thread

#include <Nimbus/Utils/Logging.hpp>

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

namespace nimbus::repl {
  fn ReadInput(std::istream& input, EventChannel& channel) -> Unit {
    String line;

    while (std::getline(input, line))
      if (Option<Command> command = Tokenize(line))
        channel.push(std::move(*command));

    const bool failed = input.bad();

    debug_log("Input stream {}", failed ? "failed" : "reached end of file");

    channel.push(InputClosed { .error = NimbusError(InputStreamFailure, failed ? "Failed to read from input" : "Input closed") });
  }

  fn StartInputReader(std::istream& input, SharedPointer<EventChannel> channel) -> Result<> {
    try {
      std::thread([&input, channel = std::move(channel)] { ReadInput(input, *channel); }).detach();
    } catch (const std::system_error& err) {
      ERR_FMT(InternalError, "Failed to start input reader: {}", err.what());
    }

    return {};
  }
} // namespace nimbus::repl
