#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "constants.hpp"

namespace curlbind::string_utils {
    namespace {
        bool is_ows(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

        bool is_tchar(unsigned char c) {
            if (std::isalnum(c) != 0) {
                return true;
            }
            return constants::TOKEN_SYMBOLS.find(static_cast<char>(c)) != std::string_view::npos;
        }
    }  // namespace

    std::string_view trim(std::string_view sv) {
        while (!sv.empty() && is_ows(sv.front())) {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && is_ows(sv.back())) {
            sv.remove_suffix(1);
        }
        return sv;
    }

    bool is_token(std::string_view sv) {
        return !sv.empty() && std::ranges::all_of(sv, [](char c) { return is_tchar(static_cast<unsigned char>(c)); });
    }

    bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if ((a[i] | constants::ASCII_LOWERCASE_BIT) != (b[i] | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        return true;
    }
}  // namespace curlbind::string_utils
