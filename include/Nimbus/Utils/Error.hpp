#pragma once

#include <cerrno>          // errno
#include <expected>        // std::{unexpected, expected}
#include <format>          // std::formatter
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum NimbusErrorCode
     * @brief Error codes for everything from provider calls to the REPL itself.
     */
    enum class NimbusErrorCode : u8 {
      ApiUnavailable,     ///< The provider API could not be reached or answered unexpectedly.
      ConfigurationError, ///< Configuration or environment issue.
      DuplicateFavourite, ///< The city is already in the favourites list.
      InputStreamFailure, ///< Standard input closed or failed. Fatal.
      InternalError,      ///< An error occurred within the application's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or command.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      LocationNotFound,   ///< The geocoder returned no match for the city/country pair.
      NetworkError,       ///< A network-related error occurred (e.g., DNS resolution, connection failure).
      NotFound,           ///< A required resource (favourite, file, API endpoint) was not found.
      Other,              ///< A generic or unclassified error originating from an external library.
      ParseError,         ///< Failed to parse data (config file, favourites file, API response).
      PermissionDenied,   ///< Insufficient permissions, or the provider rejected the API key.
      PersistenceError,   ///< The favourites file could not be written.
      Timeout,            ///< An operation timed out.
      WeatherUnavailable, ///< The provider returned no usable weather for the coordinates.
    };

    /**
     * @struct NimbusError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout Nimbus.
     */
    struct NimbusError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      NimbusErrorCode      code;     ///< The general category of the error.

      NimbusError(const NimbusErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit NimbusError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(NimbusErrorCode::InternalError) {}

      explicit NimbusError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum NimbusErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error, no_space_on_device, read_only_file_system)     = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | or_(network_unreachable, network_down, connection_refused)                   = NetworkError,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = Other
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::NimbusError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::NimbusError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace nimbus::utils

namespace std {
  template <>
  struct formatter<::nimbus::utils::error::NimbusErrorCode> : formatter<::nimbus::utils::types::StringView> {
    template <typename FormatContext>
    fn format(nimbus::utils::error::NimbusErrorCode code, FormatContext& ctx) const {
      using enum nimbus::utils::error::NimbusErrorCode;
      using matchit::match, matchit::is, matchit::_;

      nimbus::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | ConfigurationError = "ConfigurationError",
        is | DuplicateFavourite = "DuplicateFavourite",
        is | InputStreamFailure = "InputStreamFailure",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | LocationNotFound   = "LocationNotFound",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | Other              = "Other",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | PersistenceError   = "PersistenceError",
        is | Timeout            = "Timeout",
        is | WeatherUnavailable = "WeatherUnavailable",
        is | _                  = "Unknown"
      );

      return formatter<nimbus::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, msg))
#define ERR_FROM(err)           return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(err))
#define ERR_FMT(errc, fmt, ...) return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, std::format(fmt, __VA_ARGS__)))
