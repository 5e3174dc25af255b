#ifndef CURLBIND_CURL_GLOBAL_HPP
#define CURLBIND_CURL_GLOBAL_HPP

namespace curlbind::easy {

    // Process-level libcurl setup; create one before the first Handle and keep it until the last is gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace curlbind::easy

#endif
