#include "header_line.hpp"

#include <optional>
#include <string_view>

#include "string_utils.hpp"

namespace curlbind::header_line {

    std::optional<HeaderField> parse(std::string_view line) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }

        const std::string_view name = line.substr(0, colon);
        if (!string_utils::is_token(name)) {
            return std::nullopt;
        }

        return HeaderField{.name_ = name, .value_ = string_utils::trim(line.substr(colon + 1))};
    }

}  // namespace curlbind::header_line
