#ifndef CURLBIND_RESPONSE_HPP
#define CURLBIND_RESPONSE_HPP

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace curlbind::model {
    using HeaderMap = std::unordered_map<std::string, std::vector<std::string>>;

    class Response {
       public:
        Response(unsigned int code, HeaderMap headers, std::string body);

        [[nodiscard]] unsigned int get_code() const { return code_; }
        [[nodiscard]] const HeaderMap& get_headers() const { return headers_; }
        [[nodiscard]] const std::vector<std::string>& get_header(const std::string& name) const;
        [[nodiscard]] const std::string& get_body() const { return body_; }

       private:
        unsigned int code_;
        HeaderMap headers_;
        std::string body_;
    };

    // Filled by the callback bridges during a single perform() and finalized once.
    class ResponseBuilder {
       public:
        ResponseBuilder() = default;

        ~ResponseBuilder() = default;
        ResponseBuilder(const ResponseBuilder&) = delete;
        ResponseBuilder& operator=(const ResponseBuilder&) = delete;
        ResponseBuilder(ResponseBuilder&&) = default;
        ResponseBuilder& operator=(ResponseBuilder&&) = default;

        void set_code(unsigned int code) { code_ = code; }
        void add_header(std::string_view name, std::string_view value);
        void append_body(std::string_view chunk);

        [[nodiscard]] Response build() &&;

       private:
        unsigned int code_ = 0;
        HeaderMap headers_;
        std::string body_;
    };

}  // namespace curlbind::model

#endif
