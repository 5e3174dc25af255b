#include "callbacks.hpp"

#include <curl/curl.h>

#include <exception>
#include <string_view>

#include "../body/body_source.hpp"
#include "../model/response.hpp"
#include "../utils/header_line.hpp"
#include "context_registry.hpp"

namespace curlbind::easy::callbacks {

    size_t read_callback(char* buffer, size_t size, size_t n_items, void* userdata) {
        if (userdata == nullptr) {
            return 0;
        }

        const size_t bytes = size * n_items;

        auto* source = ContextRegistry::instance().find<body::IBodySource>(userdata);
        if (source == nullptr) {
            return CURL_READFUNC_ABORT;
        }

        try {
            const body::ReadResult result = source->read(buffer, bytes);
            switch (result.status_) {
                case body::ReadStatus::OK:
                    return result.bytes_ <= bytes ? result.bytes_ : CURL_READFUNC_ABORT;
                case body::ReadStatus::END_OF_STREAM:
                    return 0;
                case body::ReadStatus::FAILED:
                    return CURL_READFUNC_ABORT;
            }
        } catch (const std::exception&) {
            // must not unwind through libcurl; the abort surfaces as CURLE_ABORTED_BY_CALLBACK
            return CURL_READFUNC_ABORT;
        }

        return CURL_READFUNC_ABORT;
    }

    size_t write_callback(char* buffer, size_t size, size_t n_items, void* userdata) {
        if (userdata == nullptr) {
            return 0;
        }

        const size_t bytes = size * n_items;

        auto* builder = ContextRegistry::instance().find<model::ResponseBuilder>(userdata);
        if (builder == nullptr) {
            return 0;
        }

        try {
            builder->append_body(std::string_view(buffer, bytes));
        } catch (const std::exception&) {
            // a short count makes libcurl fail the transfer with CURLE_WRITE_ERROR
            return 0;
        }

        return bytes;
    }

    size_t header_callback(char* buffer, size_t size, size_t n_items, void* userdata) {
        if (userdata == nullptr) {
            return 0;
        }

        const size_t bytes = size * n_items;

        auto* builder = ContextRegistry::instance().find<model::ResponseBuilder>(userdata);
        if (builder == nullptr) {
            return 0;
        }

        try {
            const auto field = header_line::parse(std::string_view(buffer, bytes));
            if (field) {
                builder->add_header(field->name_, field->value_);
            }
        } catch (const std::exception&) {
            return 0;
        }

        return bytes;
    }

}  // namespace curlbind::easy::callbacks
