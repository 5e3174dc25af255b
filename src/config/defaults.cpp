#include "defaults.hpp"

#include <curl/curl.h>

#include "../easy/handle.hpp"

namespace curlbind::config {

    void apply_defaults(easy::Handle& handle) {
        handle.setopt(CURLOPT_FOLLOWLOCATION, Defaults::FOLLOW_LOCATION);
        handle.setopt(CURLOPT_MAXREDIRS, Defaults::MAX_REDIRECTS);
        handle.setopt(CURLOPT_CONNECTTIMEOUT_MS, Defaults::CONNECT_TIMEOUT_MS);
        handle.setopt(CURLOPT_TIMEOUT_MS, Defaults::TIMEOUT_MS);
        handle.setopt(CURLOPT_NOPROGRESS, Defaults::NO_PROGRESS);
        handle.setopt(CURLOPT_USERAGENT, Defaults::USER_AGENT);
        handle.setopt(CURLOPT_NOSIGNAL, Defaults::NO_SIGNAL);
    }

}  // namespace curlbind::config
