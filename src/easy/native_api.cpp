#include "native_api.hpp"

#include <curl/curl.h>

#include <memory>

namespace curlbind::native {

    CURL* LibcurlEasyApi::init() { return curl_easy_init(); }

    void LibcurlEasyApi::cleanup(CURL* handle) { curl_easy_cleanup(handle); }

    CURLcode LibcurlEasyApi::setopt_long(CURL* handle, CURLoption option, long value) { return curl_easy_setopt(handle, option, value); }

    CURLcode LibcurlEasyApi::setopt_off_t(CURL* handle, CURLoption option, curl_off_t value) { return curl_easy_setopt(handle, option, value); }

    CURLcode LibcurlEasyApi::setopt_string(CURL* handle, CURLoption option, const char* value) { return curl_easy_setopt(handle, option, value); }

    CURLcode LibcurlEasyApi::setopt_pointer(CURL* handle, CURLoption option, void* value) { return curl_easy_setopt(handle, option, value); }

    CURLcode LibcurlEasyApi::setopt_function(CURL* handle, CURLoption option, FunctionPtr value) {
        return curl_easy_setopt(handle, option, value);
    }

    CURLcode LibcurlEasyApi::perform(CURL* handle) { return curl_easy_perform(handle); }

    CURLcode LibcurlEasyApi::getinfo_long(CURL* handle, CURLINFO info, long* out) { return curl_easy_getinfo(handle, info, out); }

    CURLcode LibcurlEasyApi::getinfo_string(CURL* handle, CURLINFO info, char** out) { return curl_easy_getinfo(handle, info, out); }

    std::shared_ptr<IEasyApi> libcurl() {
        static const std::shared_ptr<IEasyApi> api = std::make_shared<LibcurlEasyApi>();
        return api;
    }

}  // namespace curlbind::native
