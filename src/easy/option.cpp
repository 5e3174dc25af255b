#include "option.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <string>
#include <variant>

namespace curlbind::option {
    namespace {
        constexpr long OPTION_TYPE_STRIDE = 10000;

        constexpr std::array<CURLoption, 7> RESERVED_OPTIONS = {
            CURLOPT_READFUNCTION, CURLOPT_READDATA, CURLOPT_WRITEFUNCTION, CURLOPT_WRITEDATA,
            CURLOPT_HEADERFUNCTION, CURLOPT_HEADERDATA, CURLOPT_ERRORBUFFER,
        };

        const easy::ErrorCode BAD_ARGUMENT{CURLE_BAD_FUNCTION_ARGUMENT};

        easy::ErrorCode marshal_string(native::IEasyApi& api, CURL* handle, CURLoption option, const std::string& value) {
            if (kind_of(option) != OptionKind::OBJECT) {
                return BAD_ARGUMENT;
            }
            return easy::ErrorCode{api.setopt_string(handle, option, value.c_str())};
        }

        easy::ErrorCode marshal_integer(native::IEasyApi& api, CURL* handle, CURLoption option, long value) {
            switch (kind_of(option)) {
                case OptionKind::INTEGER:
                    return easy::ErrorCode{api.setopt_long(handle, option, value)};
                case OptionKind::OFF_T:
                    return easy::ErrorCode{api.setopt_off_t(handle, option, static_cast<curl_off_t>(value))};
                default:
                    return BAD_ARGUMENT;
            }
        }

        easy::ErrorCode marshal_pointer(native::IEasyApi& api, CURL* handle, CURLoption option, void* value) {
            const OptionKind kind = kind_of(option);
            if (kind != OptionKind::OBJECT && kind != OptionKind::BLOB) {
                return BAD_ARGUMENT;
            }
            return easy::ErrorCode{api.setopt_pointer(handle, option, value)};
        }

        easy::ErrorCode marshal_function(native::IEasyApi& api, CURL* handle, CURLoption option, FunctionPtr value) {
            if (kind_of(option) != OptionKind::FUNCTION) {
                return BAD_ARGUMENT;
            }
            return easy::ErrorCode{api.setopt_function(handle, option, value)};
        }

        struct Marshaler {
            native::IEasyApi& api_;
            CURL* handle_;
            CURLoption option_;

            easy::ErrorCode operator()(const std::string& v) const { return marshal_string(api_, handle_, option_, v); }
            easy::ErrorCode operator()(long v) const { return marshal_integer(api_, handle_, option_, v); }
            easy::ErrorCode operator()(void* v) const { return marshal_pointer(api_, handle_, option_, v); }
            easy::ErrorCode operator()(FunctionPtr v) const { return marshal_function(api_, handle_, option_, v); }
        };
    }  // namespace

    OptionKind kind_of(CURLoption option) {
        switch (static_cast<long>(option) / OPTION_TYPE_STRIDE * OPTION_TYPE_STRIDE) {
            case CURLOPTTYPE_LONG:
                return OptionKind::INTEGER;
            case CURLOPTTYPE_OBJECTPOINT:
                return OptionKind::OBJECT;
            case CURLOPTTYPE_FUNCTIONPOINT:
                return OptionKind::FUNCTION;
            case CURLOPTTYPE_OFF_T:
                return OptionKind::OFF_T;
            case CURLOPTTYPE_BLOB:
                return OptionKind::BLOB;
            default:
                return OptionKind::UNKNOWN;
        }
    }

    bool is_reserved(CURLoption option) { return std::ranges::find(RESERVED_OPTIONS, option) != RESERVED_OPTIONS.end(); }

    easy::ErrorCode marshal(native::IEasyApi& api, CURL* handle, CURLoption option, const Value& value) {
        return std::visit(Marshaler{.api_ = api, .handle_ = handle, .option_ = option}, value);
    }

}  // namespace curlbind::option
