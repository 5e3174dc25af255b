#ifndef CURLBIND_STRING_UTILS_HPP
#define CURLBIND_STRING_UTILS_HPP

#include <string_view>

namespace curlbind::string_utils {
    // Strips spaces, tabs, CR and LF from both ends.
    std::string_view trim(std::string_view sv);

    // RFC 7230 token: one or more tchar.
    bool is_token(std::string_view sv);

    bool iequals(std::string_view a, std::string_view b);
}  // namespace curlbind::string_utils

#endif
