#ifndef CURLBIND_CONSTANTS_HPP
#define CURLBIND_CONSTANTS_HPP

#include <string_view>

namespace curlbind::constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr std::string_view TOKEN_SYMBOLS = "!#$%&'*+-.^_`|~";
    inline constexpr std::string_view OPTION_NAME_PREFIX = "CURLOPT_";
}  // namespace curlbind::constants

#endif
