#pragma once

#include <algorithm> // std::ranges::{equal, transform}
#include <cctype>    // std::{tolower, toupper}

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils::strings {
  namespace {
    using types::String;
    using types::StringView;
    using types::u8;
  } // namespace

  inline fn StrEqualsIgnoreCase(const StringView strA, const StringView strB) -> bool {
    return std::ranges::equal(strA, strB, [](const char aChar, const char bChar) {
      return std::tolower(static_cast<u8>(aChar)) == std::tolower(static_cast<u8>(bChar));
    });
  }

  inline fn ToLower(const StringView sview) -> String {
    String result(sview);

    std::ranges::transform(result, result.begin(), [](const char character) {
      return static_cast<char>(std::tolower(static_cast<u8>(character)));
    });

    return result;
  }

  /**
   * @brief Upper-cases the first letter of every space-separated word.
   * @param sview The text to convert, e.g. "light rain".
   * @return The converted text, e.g. "Light Rain".
   */
  inline fn TitleCase(const StringView sview) -> String {
    String result(sview);
    bool   atWordStart = true;

    for (char& character : result) {
      if (character == ' ') {
        atWordStart = true;
        continue;
      }

      if (atWordStart)
        character = static_cast<char>(std::toupper(static_cast<u8>(character)));

      atWordStart = false;
    }

    return result;
  }
} // namespace nimbus::utils::strings
