#include "response.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace curlbind::model {

    Response::Response(unsigned int code, HeaderMap headers, std::string body) : code_(code), headers_(std::move(headers)), body_(std::move(body)) {}

    const std::vector<std::string>& Response::get_header(const std::string& name) const {
        static const std::vector<std::string> EMPTY;

        const auto it = headers_.find(name);
        return it != headers_.end() ? it->second : EMPTY;
    }

    void ResponseBuilder::add_header(std::string_view name, std::string_view value) {
        auto it = headers_.try_emplace(std::string(name)).first;
        it->second.emplace_back(value);
    }

    void ResponseBuilder::append_body(std::string_view chunk) { body_.append(chunk); }

    Response ResponseBuilder::build() && { return {code_, std::move(headers_), std::move(body_)}; }

}  // namespace curlbind::model
