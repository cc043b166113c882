#pragma once

#include <Nimbus/Utils/Definitions.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::repl {
  namespace {
    using utils::types::None;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct Command
   * @brief One line of user input split into tokens.
   *
   * The verb (first token) is stored lower-cased; arguments are kept as typed.
   * Commands from Tokenize are never empty; verb() requires at least one token.
   */
  struct Command {
    Vec<String> tokens;

    [[nodiscard]] fn verb() const -> StringView {
      return tokens.front();
    }

    /**
     * @brief Returns the positional argument at @p index (0 is the first token after the verb).
     */
    [[nodiscard]] fn arg(const usize index) const -> Option<String> {
      if (index + 1 >= tokens.size())
        return None;

      return tokens[index + 1];
    }

    fn operator==(const Command&) const -> bool = default;
  };

  /**
   * @brief Splits a line on whitespace into a Command.
   * @param line Raw input line, possibly with a trailing carriage return.
   * @return The command, or None if the line holds no tokens.
   */
  fn Tokenize(StringView line) -> Option<Command>;
} // namespace nimbus::repl
