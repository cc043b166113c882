#include "UI.hpp"

#include <algorithm> // std::max
#include <format>    // std::format

#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Strings.hpp>

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;

namespace nimbus::ui {
  constexpr Theme DEFAULT_THEME = {
    .heading = ftxui::Color::Palette16::Cyan,
    .label   = ftxui::Color::Palette16::Yellow,
    .value   = ftxui::Color::Palette16::White,
    .border  = ftxui::Color::Palette16::GrayDark,
    .error   = ftxui::Color::Palette16::Red,
  };

  namespace {
    struct HelpRow {
      StringView verb;
      StringView args;
      StringView description;
    };

    // clang-format off
    constexpr Array<HelpRow, 6> COMMANDS = {{
      { .verb = "w",      .args = "<City> [<Country>]", .description = "Get weather by city" },
      { .verb = "f",      .args = "",                   .description = "Get weather for all of the cities in your favourites" },
      { .verb = "list",   .args = "",                   .description = "List favourites" },
      { .verb = "fav",    .args = "<City> [<Country>]", .description = "Add city to favourites" },
      { .verb = "remove", .args = "<City>",             .description = "Remove city from favourites" },
      { .verb = "help",   .args = "",                   .description = "List available commands" },
    }};
    // clang-format on

    constexpr usize SEPARATOR_WIDTH = 56;

    fn Separator(const usize width = SEPARATOR_WIDTH) -> String {
      return Colorize(String(width, '-'), DEFAULT_THEME.border);
    }
  } // namespace

  fn RenderReport(const Report& report, const UnitSystem units) -> String {
    using nimbus::utils::strings::TitleCase;

    const StringView symbol = units == UnitSystem::Imperial ? "℉" : "℃";

    const String place = report.country.empty() ? report.city : std::format("{}, {}", report.city, report.country);

    String out = std::format("\n{}\n\n", Bold(Colorize(std::format("Weather in {}:", place), DEFAULT_THEME.heading)));

    out += std::format("{}\n", Colorize(TitleCase(report.description), DEFAULT_THEME.value));
    out += std::format("{} {:.1f} {}\n", Colorize("Temperature:", DEFAULT_THEME.label), report.temperature, symbol);
    out += std::format("{} {:.1f} {}\n\n", Colorize("Feels like:", DEFAULT_THEME.label), report.feelsLike, symbol);
    out += Separator();
    out += '\n';

    return out;
  }

  fn RenderFavourites(const Vec<Location>& favourites) -> String {
    if (favourites.empty())
      return "No favourites added\n";

    String out = std::format("\n{}\n\n", Bold(Colorize("------Favourites------", DEFAULT_THEME.heading)));

    for (const Location& location : favourites)
      out += std::format("{}, {}\n", location.city, location.country);

    out += '\n';
    out += Separator(22);
    out += '\n';

    return out;
  }

  fn RenderHelp() -> String {
    usize verbWidth = 0;
    usize argsWidth = 0;

    for (const HelpRow& row : COMMANDS) {
      verbWidth = std::max(verbWidth, row.verb.size());
      argsWidth = std::max(argsWidth, row.args.size());
    }

    String out = std::format("\n{}\n\n", Bold(Colorize("-------Commands-------", DEFAULT_THEME.heading)));

    for (const HelpRow& row : COMMANDS)
      out += std::format("{}  {:<{}}  |  {}\n", Colorize(std::format("{:<{}}", row.verb, verbWidth), DEFAULT_THEME.label), row.args, argsWidth, row.description);

    out += '\n';
    out += Separator();
    out += '\n';

    return out;
  }

  fn RenderError(const NimbusError& error, const StringView subject) -> String {
    if (subject.empty())
      return std::format("{}\n", Colorize(error.message, DEFAULT_THEME.error));

    return std::format("{}\n", Colorize(std::format("{}: {}", subject, error.message), DEFAULT_THEME.error));
  }

  fn RenderMessage(const StringView message) -> String {
    return std::format("{}\n", message);
  }
} // namespace nimbus::ui
