#ifndef CURLBIND_HANDLE_CONFIG_HPP
#define CURLBIND_HANDLE_CONFIG_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "../easy/handle.hpp"
#include "../easy/option.hpp"

namespace curlbind::config {
    struct ConfiguredOption {
        std::string name_;
        option::Option option_;
    };

    // Handle settings read from JSON:
    //   { "use_defaults": true, "headers": ["Accept: */*"], "options": { "URL": "...", "TIMEOUT_MS": 5000 } }
    // Option names are libcurl's, with or without the CURLOPT_ prefix, in any case.
    struct HandleConfig {
        bool use_defaults_ = false;
        std::vector<std::string> headers_;
        std::vector<ConfiguredOption> options_;

        [[nodiscard]] static HandleConfig load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static HandleConfig parse_json(std::string_view json);
    };

    // Defaults first (if requested), then headers, then options in file order. Throws CurlError.
    void apply(const HandleConfig& config, easy::Handle& handle);
}  // namespace curlbind::config

#endif
