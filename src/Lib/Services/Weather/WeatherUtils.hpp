#pragma once

#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Types.hpp"

namespace nimbus::services::weather::utils {
  namespace {
    using nimbus::utils::types::i32;
    using nimbus::utils::types::i64;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::StringView;
  } // namespace

  /**
   * @brief A completed HTTP exchange: status code and raw body.
   */
  struct HttpResponse {
    i64    status;
    String body;
  };

  /**
   * @brief Performs a blocking GET with the timeouts shared by every provider.
   * @param url Fully formed request URL.
   * @return The response (of any status), or a transport error (Timeout, NetworkError, ApiUnavailable).
   */
  fn HttpGet(const String& url) -> Result<HttpResponse>;

  /**
   * @brief Percent-encodes a query parameter value.
   */
  fn EscapeQuery(StringView value) -> Result<String>;

  /**
   * @brief Provides a human-readable description for an OpenMeteo weather code.
   * @param code The WMO weather interpretation code.
   * @return The description, or "unknown" if the code is not recognized.
   */
  fn GetOpenmeteoWeatherDescription(i32 code) -> String;
} // namespace nimbus::services::weather::utils
