#ifndef CURLBIND_BODY_SOURCE_HPP
#define CURLBIND_BODY_SOURCE_HPP

#include <cstddef>
#include <istream>
#include <string>

namespace curlbind::body {
    enum class ReadStatus { OK, END_OF_STREAM, FAILED };

    struct ReadResult {
        ReadStatus status_ = ReadStatus::OK;
        size_t bytes_ = 0;

        static ReadResult ok(size_t bytes) { return ReadResult{.status_ = ReadStatus::OK, .bytes_ = bytes}; }
        static ReadResult end_of_stream() { return ReadResult{.status_ = ReadStatus::END_OF_STREAM, .bytes_ = 0}; }
        static ReadResult failed() { return ReadResult{.status_ = ReadStatus::FAILED, .bytes_ = 0}; }
    };

    // Pull-based supplier of outbound request bytes. The engine calls read() from inside Handle::perform;
    // the source must outlive that call.
    class IBodySource {
       public:
        IBodySource() = default;
        virtual ~IBodySource() = default;
        IBodySource(const IBodySource&) = delete;
        IBodySource& operator=(const IBodySource&) = delete;
        IBodySource(IBodySource&&) = delete;
        IBodySource& operator=(IBodySource&&) = delete;

        // Writes at most `max_bytes` into `dst`.
        virtual ReadResult read(char* dst, size_t max_bytes) = 0;
    };

    class StringBodySource : public IBodySource {
       public:
        explicit StringBodySource(std::string payload);

        ReadResult read(char* dst, size_t max_bytes) override;

        [[nodiscard]] size_t remaining() const { return payload_.size() - offset_; }

       private:
        std::string payload_;
        size_t offset_ = 0;
    };

    class StreamBodySource : public IBodySource {
       public:
        explicit StreamBodySource(std::istream& in);

        ReadResult read(char* dst, size_t max_bytes) override;

       private:
        std::istream& in_;
    };

}  // namespace curlbind::body

#endif
