#ifndef CURLBIND_OPTION_HPP
#define CURLBIND_OPTION_HPP

#include <curl/curl.h>

#include <string>
#include <variant>

#include "error_code.hpp"
#include "native_api.hpp"

namespace curlbind::option {
    using FunctionPtr = native::FunctionPtr;

    using Value = std::variant<std::string, long, void*, FunctionPtr>;

    struct Option {
        CURLoption key_;
        Value value_;
    };

    // libcurl encodes the expected argument type of an option in the range its id falls into.
    enum class OptionKind { INTEGER, OBJECT, FUNCTION, OFF_T, BLOB, UNKNOWN };

    OptionKind kind_of(CURLoption option);

    // Options perform() wires itself on every call, plus the error buffer owned by the handle.
    bool is_reserved(CURLoption option);

    template <typename Fn>
    FunctionPtr to_function_ptr(Fn* fn) {
        return reinterpret_cast<FunctionPtr>(fn);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    }

    // Issues exactly one native setopt call, or none if `value` does not fit the option's kind.
    easy::ErrorCode marshal(native::IEasyApi& api, CURL* handle, CURLoption option, const Value& value);

}  // namespace curlbind::option

#endif
