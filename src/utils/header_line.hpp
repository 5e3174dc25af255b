#ifndef CURLBIND_HEADER_LINE_HPP
#define CURLBIND_HEADER_LINE_HPP

#include <optional>
#include <string_view>

namespace curlbind::header_line {
    struct HeaderField {
        std::string_view name_;
        std::string_view value_;
    };

    // Splits one raw "Name: value\r\n" line. Status lines, the terminating blank line and anything whose
    // name is not a token yield std::nullopt. The views point into `line`.
    std::optional<HeaderField> parse(std::string_view line);
}  // namespace curlbind::header_line

#endif
