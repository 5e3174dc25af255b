#ifndef CURLBIND_HANDLE_HPP
#define CURLBIND_HANDLE_HPP

#include <curl/curl.h>

#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "../body/body_source.hpp"
#include "../model/response.hpp"
#include "error_code.hpp"
#include "native_api.hpp"
#include "option.hpp"

struct curl_slist;

namespace curlbind::easy {

    // Owns one easy handle. Not safe for concurrent use: setopt() and perform() both mutate the handle's
    // configuration in place.
    class Handle {
       public:
        Handle();
        explicit Handle(std::shared_ptr<native::IEasyApi> api);

        ~Handle();
        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;
        Handle(Handle&&) = delete;
        Handle& operator=(Handle&&) = delete;

        // Throws CurlError. The read, write and header callbacks with their data pointers belong to
        // perform() and are rejected here.
        void setopt(CURLoption option, option::Value value);
        void setopt(option::Option opt);
        void set_url(const std::string& url);
        void set_headers(const std::vector<std::string>& headers);

        // Runs one blocking transfer. `body`, if any, is only borrowed for the duration of the call.
        // Throws CurlError on any failure; partial headers and body are never returned.
        model::Response perform(body::IBodySource* body = nullptr);

        [[nodiscard]] unsigned int get_response_code() const;
        [[nodiscard]] std::string get_effective_url() const;

       private:
        void install_error_buffer();
        void wire_callbacks(void* response_context, void* body_context);
        void set_internal(CURLoption option, const option::Value& value);
        [[nodiscard]] long get_info_long(CURLINFO info) const;

        std::shared_ptr<native::IEasyApi> api_;
        CURL* handle_{};
        std::array<char, CURL_ERROR_SIZE> error_buf_{};
        curl_slist* headers_{};
        std::unordered_map<CURLoption, std::unique_ptr<option::Value>> retained_values_;
    };

}  // namespace curlbind::easy

#endif
