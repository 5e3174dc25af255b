#ifndef CURLBIND_ERROR_CODE_HPP
#define CURLBIND_ERROR_CODE_HPP

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace curlbind::easy {

    class ErrorCode {
       public:
        constexpr ErrorCode() = default;
        constexpr explicit ErrorCode(CURLcode code) : code_(code) {}

        [[nodiscard]] constexpr bool is_success() const { return code_ == CURLE_OK; }
        [[nodiscard]] constexpr CURLcode value() const { return code_; }
        [[nodiscard]] std::string description() const;

        constexpr bool operator==(const ErrorCode&) const = default;

       private:
        CURLcode code_ = CURLE_OK;
    };

    // Thrown by every fallible native call site. `operation_` names the native call.
    struct CurlError : public std::runtime_error {
        ErrorCode code_;
        std::string operation_;
        explicit CurlError(ErrorCode code, std::string operation, const std::string& detail);
    };

    // Throws a CurlError when `code` is not a success; `detail` overrides the curl_easy_strerror text when non-empty.
    void throw_if_failed(ErrorCode code, const char* operation, const char* detail = nullptr);

}  // namespace curlbind::easy

#endif
