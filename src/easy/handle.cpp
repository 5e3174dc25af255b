#include "handle.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "callbacks.hpp"
#include "context_registry.hpp"

namespace curlbind::easy {
    namespace {
        constexpr const char* SETOPT = "curl_easy_setopt";
        constexpr const char* PERFORM = "curl_easy_perform";
        constexpr const char* GETINFO = "curl_easy_getinfo";
    }  // namespace

    Handle::Handle() : Handle(native::libcurl()) {}

    Handle::Handle(std::shared_ptr<native::IEasyApi> api) : api_(std::move(api)) {
        if (api_ == nullptr) {
            throw std::invalid_argument("Handle requires a native engine");
        }

        handle_ = api_->init();
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        install_error_buffer();
    }

    Handle::~Handle() {
        api_->cleanup(handle_);

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
    }

    void Handle::install_error_buffer() {
        error_buf_[0] = '\0';

        const ErrorCode rc{api_->setopt_pointer(handle_, CURLOPT_ERRORBUFFER, error_buf_.data())};
        if (!rc.is_success()) {
            // the destructor will not run for a half-built object
            api_->cleanup(handle_);
            handle_ = nullptr;
            throw_if_failed(rc, SETOPT);
        }
    }

    void Handle::setopt(CURLoption option, option::Value value) {
        if (option::is_reserved(option)) {
            throw CurlError(ErrorCode{CURLE_BAD_FUNCTION_ARGUMENT}, SETOPT, "option is managed by Handle::perform");
        }

        // Heap-held so the string address survives until the option is replaced; libcurl keeps some
        // string options (POSTFIELDS) by pointer.
        auto owned = std::make_unique<option::Value>(std::move(value));
        throw_if_failed(option::marshal(*api_, handle_, option, *owned), SETOPT);

        if (std::holds_alternative<std::string>(*owned)) {
            retained_values_[option] = std::move(owned);
        } else {
            retained_values_.erase(option);
        }
    }

    void Handle::setopt(option::Option opt) { setopt(opt.key_, std::move(opt.value_)); }

    void Handle::set_url(const std::string& url) { setopt(CURLOPT_URL, url); }

    void Handle::set_headers(const std::vector<std::string>& headers) {
        curl_slist* list = nullptr;
        for (const auto& h : headers) {
            curl_slist* next = curl_slist_append(list, h.c_str());
            if (next == nullptr) {
                curl_slist_free_all(list);
                throw std::runtime_error("curl_slist_append failed");
            }
            list = next;
        }

        const ErrorCode rc = option::marshal(*api_, handle_, CURLOPT_HTTPHEADER, static_cast<void*>(list));
        if (!rc.is_success()) {
            curl_slist_free_all(list);
            throw_if_failed(rc, SETOPT);
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
        headers_ = list;
    }

    void Handle::set_internal(CURLoption option, const option::Value& value) { throw_if_failed(option::marshal(*api_, handle_, option, value), SETOPT); }

    void Handle::wire_callbacks(void* response_context, void* body_context) {
        set_internal(CURLOPT_READFUNCTION, option::to_function_ptr(&callbacks::read_callback));
        set_internal(CURLOPT_READDATA, body_context);

        set_internal(CURLOPT_WRITEFUNCTION, option::to_function_ptr(&callbacks::write_callback));
        set_internal(CURLOPT_WRITEDATA, response_context);

        set_internal(CURLOPT_HEADERFUNCTION, option::to_function_ptr(&callbacks::header_callback));
        set_internal(CURLOPT_HEADERDATA, response_context);
    }

    model::Response Handle::perform(body::IBodySource* body) {
        model::ResponseBuilder builder;

        ContextRegistry& registry = ContextRegistry::instance();
        const ContextRegistry::Scoped response_context = registry.add(&builder);
        const ContextRegistry::Scoped body_context = body != nullptr ? registry.add(body) : ContextRegistry::Scoped{};

        // Always set these per transfer (don't rely on old values)
        wire_callbacks(response_context.opaque(), body_context.opaque());

        error_buf_[0] = '\0';
        const ErrorCode rc{api_->perform(handle_)};
        throw_if_failed(rc, PERFORM, error_buf_.data());

        // A failed status lookup fails the whole call, dropping a transfer that completed.
        builder.set_code(get_response_code());

        return std::move(builder).build();
    }

    unsigned int Handle::get_response_code() const { return static_cast<unsigned int>(get_info_long(CURLINFO_RESPONSE_CODE)); }

    std::string Handle::get_effective_url() const {
        char* url = nullptr;
        throw_if_failed(ErrorCode{api_->getinfo_string(handle_, CURLINFO_EFFECTIVE_URL, &url)}, GETINFO);
        return url != nullptr ? std::string(url) : std::string{};
    }

    long Handle::get_info_long(CURLINFO info) const {
        long value = 0;
        throw_if_failed(ErrorCode{api_->getinfo_long(handle_, info, &value)}, GETINFO);
        return value;
    }

}  // namespace curlbind::easy
