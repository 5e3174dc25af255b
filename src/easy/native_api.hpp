#ifndef CURLBIND_NATIVE_API_HPP
#define CURLBIND_NATIVE_API_HPP

#include <curl/curl.h>

#include <memory>

namespace curlbind::native {
    // Erased function pointer; every callback option is passed through this type.
    using FunctionPtr = void (*)();

    // The function-level surface of the libcurl easy interface. curl_easy_setopt and curl_easy_getinfo are
    // variadic, so each accepted C type gets its own entry point and the variadic call is only made with
    // exactly that type.
    class IEasyApi {
       public:
        IEasyApi() = default;
        virtual ~IEasyApi() = default;
        IEasyApi(const IEasyApi&) = delete;
        IEasyApi& operator=(const IEasyApi&) = delete;
        IEasyApi(IEasyApi&&) = delete;
        IEasyApi& operator=(IEasyApi&&) = delete;

        virtual CURL* init() = 0;
        virtual void cleanup(CURL* handle) = 0;

        virtual CURLcode setopt_long(CURL* handle, CURLoption option, long value) = 0;
        virtual CURLcode setopt_off_t(CURL* handle, CURLoption option, curl_off_t value) = 0;
        virtual CURLcode setopt_string(CURL* handle, CURLoption option, const char* value) = 0;
        virtual CURLcode setopt_pointer(CURL* handle, CURLoption option, void* value) = 0;
        virtual CURLcode setopt_function(CURL* handle, CURLoption option, FunctionPtr value) = 0;

        virtual CURLcode perform(CURL* handle) = 0;

        virtual CURLcode getinfo_long(CURL* handle, CURLINFO info, long* out) = 0;
        virtual CURLcode getinfo_string(CURL* handle, CURLINFO info, char** out) = 0;
    };

    class LibcurlEasyApi : public IEasyApi {
       public:
        LibcurlEasyApi() = default;
        ~LibcurlEasyApi() override = default;
        LibcurlEasyApi(const LibcurlEasyApi&) = delete;
        LibcurlEasyApi& operator=(const LibcurlEasyApi&) = delete;
        LibcurlEasyApi(LibcurlEasyApi&&) = delete;
        LibcurlEasyApi& operator=(LibcurlEasyApi&&) = delete;

        CURL* init() override;
        void cleanup(CURL* handle) override;

        CURLcode setopt_long(CURL* handle, CURLoption option, long value) override;
        CURLcode setopt_off_t(CURL* handle, CURLoption option, curl_off_t value) override;
        CURLcode setopt_string(CURL* handle, CURLoption option, const char* value) override;
        CURLcode setopt_pointer(CURL* handle, CURLoption option, void* value) override;
        CURLcode setopt_function(CURL* handle, CURLoption option, FunctionPtr value) override;

        CURLcode perform(CURL* handle) override;

        CURLcode getinfo_long(CURL* handle, CURLINFO info, long* out) override;
        CURLcode getinfo_string(CURL* handle, CURLINFO info, char** out) override;
    };

    // Process-wide libcurl engine shared by every default-constructed Handle.
    std::shared_ptr<IEasyApi> libcurl();

}  // namespace curlbind::native

#endif
