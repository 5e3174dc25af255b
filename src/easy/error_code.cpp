#include "error_code.hpp"

#include <curl/curl.h>

#include <string>
#include <utility>

namespace curlbind::easy {

    std::string ErrorCode::description() const { return curl_easy_strerror(code_); }

    CurlError::CurlError(ErrorCode code, std::string operation,  // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string& detail)
        : std::runtime_error(operation + " failed: " + detail), code_(code), operation_(std::move(operation)) {}

    void throw_if_failed(ErrorCode code, const char* operation, const char* detail) {
        if (code.is_success()) {
            return;
        }

        if (detail != nullptr && detail[0] != '\0') {
            throw CurlError(code, operation, detail);
        }

        throw CurlError(code, operation, code.description());
    }

}  // namespace curlbind::easy
