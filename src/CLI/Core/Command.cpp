#include "Command.hpp"

#include <cctype> // std::isspace

#include <Nimbus/Utils/Strings.hpp>

using namespace nimbus::utils::types;

namespace nimbus::repl {
  fn Tokenize(const StringView line) -> Option<Command> {
    Command command;

    usize pos = 0;

    while (pos < line.size()) {
      while (pos < line.size() && std::isspace(static_cast<u8>(line[pos])))
        ++pos;

      const usize start = pos;

      while (pos < line.size() && !std::isspace(static_cast<u8>(line[pos])))
        ++pos;

      if (pos > start)
        command.tokens.emplace_back(line.substr(start, pos - start));
    }

    if (command.tokens.empty())
      return None;

    command.tokens.front() = utils::strings::ToLower(command.tokens.front());

    return command;
  }
} // namespace nimbus::repl
