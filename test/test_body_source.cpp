#include "body/body_source.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace curlbind::body;

TEST(StringBodySourceTest, ServesPayloadInChunksThenEnds) {
    StringBodySource source("abcdefg");
    char buf[4] = {};

    auto r = source.read(buf, sizeof(buf));
    EXPECT_EQ(r.status_, ReadStatus::OK);
    ASSERT_EQ(r.bytes_, 4u);
    EXPECT_EQ(std::string(buf, r.bytes_), "abcd");

    r = source.read(buf, sizeof(buf));
    EXPECT_EQ(r.status_, ReadStatus::OK);
    ASSERT_EQ(r.bytes_, 3u);
    EXPECT_EQ(std::string(buf, r.bytes_), "efg");
    EXPECT_EQ(source.remaining(), 0u);

    r = source.read(buf, sizeof(buf));
    EXPECT_EQ(r.status_, ReadStatus::END_OF_STREAM);
    EXPECT_EQ(r.bytes_, 0u);
}

TEST(StringBodySourceTest, EmptyPayloadEndsImmediately) {
    StringBodySource source("");
    char buf[8] = {};
    EXPECT_EQ(source.read(buf, sizeof(buf)).status_, ReadStatus::END_OF_STREAM);
}

TEST(StreamBodySourceTest, ReadsUntilEndOfStream) {
    std::istringstream in("hello world");
    StreamBodySource source(in);
    char buf[6] = {};
    std::string collected;

    for (;;) {
        const auto r = source.read(buf, sizeof(buf));
        if (r.status_ != ReadStatus::OK) {
            EXPECT_EQ(r.status_, ReadStatus::END_OF_STREAM);
            break;
        }
        collected.append(buf, r.bytes_);
    }

    EXPECT_EQ(collected, "hello world");
}

TEST(StreamBodySourceTest, BadStreamIsAFailure) {
    std::istringstream in("data");
    in.setstate(std::ios::badbit);
    StreamBodySource source(in);
    char buf[4] = {};

    EXPECT_EQ(source.read(buf, sizeof(buf)).status_, ReadStatus::FAILED);
}

TEST(ReadResultTest, FactoriesSetStatus) {
    EXPECT_EQ(ReadResult::ok(5).bytes_, 5u);
    EXPECT_EQ(ReadResult::end_of_stream().status_, ReadStatus::END_OF_STREAM);
    EXPECT_EQ(ReadResult::failed().status_, ReadStatus::FAILED);
}
