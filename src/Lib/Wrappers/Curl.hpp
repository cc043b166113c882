#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace Curl {
  namespace {
    using nimbus::utils::error::NimbusError;
    using enum nimbus::utils::error::NimbusErrorCode;

    using nimbus::utils::types::Err;
    using nimbus::utils::types::i32;
    using nimbus::utils::types::i64;
    using nimbus::utils::types::None;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::RawPointer;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None;    ///< URL to set for the transfer
    String*        writeBuffer        = nullptr; ///< Pointer to a string buffer to store the response
    Option<i64>    timeoutSecs        = None;    ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None;    ///< Timeout for the connection phase in seconds
    Option<String> userAgent          = None;    ///< User-agent string
    bool           noSignal           = true;    ///< Disable signal-based timeouts; required when transfers run on worker threads
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   */
  class Easy {
    CURL*               m_curl      = nullptr;
    Option<NimbusError> m_initError = None; ///< Stores any error that occurred during initialization via options constructor

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

   public:
    /**
     * @brief Constructor with options. Initializes a CURL easy handle and sets options.
     * @param options The options to configure the CURL handle.
     */
    explicit Easy(const EasyOptions& options)
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = NimbusError(ApiUnavailable, "curl_easy_init() failed");
        return;
      }

      if (options.url)
        if (Result res = setUrl(*options.url); !res) {
          m_initError = res.error();
          return;
        }

      if (options.writeBuffer)
        if (Result res = setWriteFunction(options.writeBuffer); !res) {
          m_initError = res.error();
          return;
        }

      if (options.timeoutSecs)
        if (Result res = setTimeout(*options.timeoutSecs); !res) {
          m_initError = res.error();
          return;
        }

      if (options.connectTimeoutSecs)
        if (Result res = setConnectTimeout(*options.connectTimeoutSecs); !res) {
          m_initError = res.error();
          return;
        }

      if (options.userAgent)
        if (Result res = setUserAgent(*options.userAgent); !res) {
          m_initError = res.error();
          return;
        }

      if (options.noSignal)
        if (Result res = setOpt(CURLOPT_NOSIGNAL, 1L); !res) {
          m_initError = res.error();
          return;
        }
    }

    /**
     * @brief Destructor. Cleans up the CURL easy handle.
     */
    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    // Non-copyable
    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);
        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    /**
     * @brief Checks if the CURL handle is valid and initialized without errors.
     * @return True if the handle is valid and no initialization error occurred, false otherwise.
     */
    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    /**
     * @brief Gets any error that occurred during initialization via the options constructor.
     * @return An Option containing a NimbusError if initialization failed, otherwise None.
     */
    [[nodiscard]] fn getInitializationError() const -> const Option<NimbusError>& {
      return m_initError;
    }

    /**
     * @brief Sets a CURL option.
     * @tparam T The type of the option value.
     * @param option The CURL option to set.
     * @param value The value to set for the option.
     * @return A Result indicating success or failure.
     */
    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR(InternalError, "CURL handle initialization previously failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(Other, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking file transfer.
     * @return A Result indicating success or failure.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;

        ERR_FMT(
          match(res)(
            is | CURLE_OPERATION_TIMEDOUT                                                           = Timeout,
            is | or_(CURLE_COULDNT_RESOLVE_HOST, CURLE_COULDNT_CONNECT, CURLE_COULDNT_RESOLVE_PROXY) = NetworkError,
            is | _                                                                                  = ApiUnavailable
          ),
          "curl_easy_perform failed: {}",
          curl_easy_strerror(res)
        );
      }

      return {};
    }

    /**
     * @brief Gets the HTTP status code of the last completed transfer.
     * @return A Result containing the status code or an error.
     */
    fn getResponseCode() -> Result<i64> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      long code = 0;

      if (const CURLcode res = curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &code); res != CURLE_OK)
        ERR_FMT(Other, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return static_cast<i64>(code);
    }

    /**
     * @brief Escapes a URL string.
     * @param url The URL string to escape.
     * @return A Result containing the escaped string or an error.
     */
    static fn escape(const String& url) -> Result<String> {
      char* escapedUrl = curl_easy_escape(nullptr, url.c_str(), static_cast<int>(url.length()));

      if (!escapedUrl)
        ERR(InternalError, "curl_easy_escape failed");

      String result(escapedUrl);

      curl_free(escapedUrl);

      return result;
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }

    fn setTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_TIMEOUT, static_cast<long>(timeout));
    }

    fn setConnectTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout));
    }

    fn setUserAgent(const String& userAgent) -> Result<> {
      return setOpt(CURLOPT_USERAGENT, userAgent.c_str());
    }
  };

  /**
   * @brief Initializes CURL globally. Must be called once, before any thread creates an Easy handle.
   * @note There is no matching cleanup: fetch threads still running at exit are abandoned, not joined.
   * @param flags CURL global init flags.
   * @return A Result indicating success or failure.
   */
  inline fn GlobalInit(const i32 flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(Other, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }
} // namespace Curl
