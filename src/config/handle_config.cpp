#include "handle_config.hpp"

#include <curl/curl.h>
#include <simdjson.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../easy/option.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "defaults.hpp"

namespace curlbind::config {
    namespace {
        using JsonValue = simdjson::simdjson_result<simdjson::ondemand::value>;

        struct ConfigKeys {
            static constexpr std::string_view USE_DEFAULTS = "use_defaults";
            static constexpr std::string_view HEADERS = "headers";
            static constexpr std::string_view OPTIONS = "options";
        };

        const curl_easyoption* resolve_option(std::string_view name) {
            if (name.size() > constants::OPTION_NAME_PREFIX.size() &&
                string_utils::iequals(name.substr(0, constants::OPTION_NAME_PREFIX.size()), constants::OPTION_NAME_PREFIX)) {
                name.remove_prefix(constants::OPTION_NAME_PREFIX.size());
            }

            const std::string lookup(name);
            const curl_easyoption* found = curl_easy_option_by_name(lookup.c_str());
            if (found == nullptr) {
                throw std::runtime_error("Unknown option: " + lookup);
            }

            if (option::is_reserved(found->id)) {
                throw std::runtime_error("Option cannot be configured: " + lookup);
            }

            return found;
        }

        option::Value to_option_value(const curl_easyoption& opt, JsonValue value) {
            simdjson::ondemand::json_type type{};
            if (value.type().get(type) != simdjson::SUCCESS) {
                throw std::runtime_error(std::string("Invalid value for option: ") + opt.name);
            }

            switch (type) {
                case simdjson::ondemand::json_type::string: {
                    std::string_view s;
                    if (opt.type != CURLOT_STRING || value.get_string().get(s) != simdjson::SUCCESS) {
                        break;
                    }
                    return std::string(s);
                }
                case simdjson::ondemand::json_type::number: {
                    int64_t n = 0;
                    if ((opt.type != CURLOT_LONG && opt.type != CURLOT_VALUES && opt.type != CURLOT_OFF_T) ||
                        value.get_int64().get(n) != simdjson::SUCCESS) {
                        break;
                    }
                    return static_cast<long>(n);
                }
                case simdjson::ondemand::json_type::boolean: {
                    bool b = false;
                    if (opt.type != CURLOT_LONG || value.get_bool().get(b) != simdjson::SUCCESS) {
                        break;
                    }
                    return b ? 1L : 0L;
                }
                default:
                    break;
            }

            throw std::runtime_error(std::string("Value type does not match option: ") + opt.name);
        }

        void parse_headers(JsonValue value, HandleConfig& out) {
            simdjson::ondemand::array headers;
            if (value.get_array().get(headers) != simdjson::SUCCESS) {
                throw std::runtime_error("Invalid headers");
            }

            for (auto element : headers) {
                std::string_view header;
                if (element.get_string().get(header) != simdjson::SUCCESS) {
                    throw std::runtime_error("Invalid header entry");
                }
                out.headers_.emplace_back(header);
            }
        }

        void parse_options(JsonValue value, HandleConfig& out) {
            simdjson::ondemand::object options;
            if (value.get_object().get(options) != simdjson::SUCCESS) {
                throw std::runtime_error("Invalid options");
            }

            for (auto field : options) {
                std::string_view name;
                if (field.unescaped_key().get(name) != simdjson::SUCCESS) {
                    throw std::runtime_error("Invalid option name");
                }

                const curl_easyoption* opt = resolve_option(name);
                out.options_.push_back(ConfiguredOption{
                    .name_ = opt->name,
                    .option_ = option::Option{.key_ = opt->id, .value_ = to_option_value(*opt, field.value())},
                });
            }
        }

        HandleConfig parse_padded(const simdjson::padded_string& json) {
            simdjson::ondemand::parser parser;
            simdjson::ondemand::document doc;
            if (parser.iterate(json).get(doc) != simdjson::SUCCESS) {
                throw std::runtime_error("Invalid config JSON");
            }

            simdjson::ondemand::object root;
            if (doc.get_object().get(root) != simdjson::SUCCESS) {
                throw std::runtime_error("Config must be a JSON object");
            }

            HandleConfig config;
            for (auto field : root) {
                std::string_view key;
                if (field.unescaped_key().get(key) != simdjson::SUCCESS) {
                    throw std::runtime_error("Invalid config key");
                }

                if (key == ConfigKeys::USE_DEFAULTS) {
                    if (field.value().get_bool().get(config.use_defaults_) != simdjson::SUCCESS) {
                        throw std::runtime_error("Invalid use_defaults");
                    }
                } else if (key == ConfigKeys::HEADERS) {
                    parse_headers(field.value(), config);
                } else if (key == ConfigKeys::OPTIONS) {
                    parse_options(field.value(), config);
                } else {
                    throw std::runtime_error("Unknown config key: " + std::string(key));
                }
            }

            return config;
        }
    }  // namespace

    HandleConfig HandleConfig::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::SUCCESS) {
            throw std::runtime_error("Failed to read config file: " + path.string());
        }

        return parse_padded(json);
    }

    HandleConfig HandleConfig::parse_json(std::string_view json) { return parse_padded(simdjson::padded_string(json)); }

    void apply(const HandleConfig& config, easy::Handle& handle) {
        if (config.use_defaults_) {
            apply_defaults(handle);
        }

        if (!config.headers_.empty()) {
            handle.set_headers(config.headers_);
        }

        for (const auto& configured : config.options_) {
            handle.setopt(configured.option_);
        }
    }

}  // namespace curlbind::config
