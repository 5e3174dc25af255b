#ifndef CURLBIND_DEFAULTS_HPP
#define CURLBIND_DEFAULTS_HPP

#include "../easy/handle.hpp"

namespace curlbind::config {
    struct Defaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr long TIMEOUT_MS = 30'000L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr const char* USER_AGENT = "curlbind/1.0";
    };

    void apply_defaults(easy::Handle& handle);
}  // namespace curlbind::config

#endif
