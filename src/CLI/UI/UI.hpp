#pragma once

#include <ftxui/screen/color.hpp> // ftxui::Color

#include <Nimbus/Services/Weather.hpp>

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::ui {
  namespace {
    using services::weather::Location;
    using services::weather::Report;
    using services::weather::UnitSystem;

    using utils::error::NimbusError;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  struct Theme {
    ftxui::Color::Palette16 heading;
    ftxui::Color::Palette16 label;
    ftxui::Color::Palette16 value;
    ftxui::Color::Palette16 border;
    ftxui::Color::Palette16 error;
  };

  extern const Theme DEFAULT_THEME;

  inline constexpr StringView PROMPT = "\nCommand: ";

  /**
   * @brief Formats one weather report.
   * @param report The report to show. City and country should already be filled in.
   * @param units Decides the temperature unit symbol.
   * @return The formatted block, ending in a separator line.
   */
  fn RenderReport(const Report& report, UnitSystem units) -> String;

  /**
   * @brief Formats the favourites list, or "No favourites added" when it is empty.
   */
  fn RenderFavourites(const Vec<Location>& favourites) -> String;

  fn RenderHelp() -> String;

  /**
   * @brief Formats an error for the REPL.
   * @param error The error to show.
   * @param subject What the failed command was about (usually a city); may be empty.
   */
  fn RenderError(const NimbusError& error, StringView subject = {}) -> String;

  /**
   * @brief Formats a plain status message such as a confirmation.
   */
  fn RenderMessage(StringView message) -> String;
} // namespace nimbus::ui
