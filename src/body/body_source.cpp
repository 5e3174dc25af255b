#include "body_source.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <string>

namespace curlbind::body {

    StringBodySource::StringBodySource(std::string payload) : payload_(std::move(payload)) {}

    ReadResult StringBodySource::read(char* dst, size_t max_bytes) {
        if (offset_ >= payload_.size()) {
            return ReadResult::end_of_stream();
        }

        const size_t n = std::min(max_bytes, payload_.size() - offset_);
        std::memcpy(dst, payload_.data() + offset_, n);
        offset_ += n;
        return ReadResult::ok(n);
    }

    StreamBodySource::StreamBodySource(std::istream& in) : in_(in) {}

    ReadResult StreamBodySource::read(char* dst, size_t max_bytes) {
        if (in_.bad()) {
            return ReadResult::failed();
        }

        if (max_bytes == 0) {
            return ReadResult::ok(0);
        }

        in_.read(dst, static_cast<std::streamsize>(max_bytes));
        const auto n = static_cast<size_t>(in_.gcount());

        if (in_.bad()) {
            return ReadResult::failed();
        }

        if (n == 0) {
            // eof() also sets failbit on a short read; anything else that stops the stream is a failure
            return in_.eof() ? ReadResult::end_of_stream() : ReadResult::failed();
        }

        return ReadResult::ok(n);
    }

}  // namespace curlbind::body
