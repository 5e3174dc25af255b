#include "easy/error_code.hpp"

#include <curl/curl.h>
#include <gtest/gtest.h>

#include <string>

using namespace curlbind::easy;

TEST(ErrorCodeTest, OnlyOkIsSuccess) {
    EXPECT_TRUE(ErrorCode{CURLE_OK}.is_success());
    EXPECT_TRUE(ErrorCode{}.is_success());
    EXPECT_FALSE(ErrorCode{CURLE_COULDNT_RESOLVE_HOST}.is_success());
    EXPECT_FALSE(ErrorCode{CURLE_ABORTED_BY_CALLBACK}.is_success());
}

TEST(ErrorCodeTest, KeepsNativeValue) {
    const ErrorCode code{CURLE_WRITE_ERROR};
    EXPECT_EQ(code.value(), CURLE_WRITE_ERROR);
    EXPECT_EQ(code, ErrorCode{CURLE_WRITE_ERROR});
    EXPECT_NE(code, ErrorCode{CURLE_READ_ERROR});
}

TEST(ErrorCodeTest, DescriptionComesFromLibcurl) {
    const ErrorCode code{CURLE_UNSUPPORTED_PROTOCOL};
    EXPECT_EQ(code.description(), std::string(curl_easy_strerror(CURLE_UNSUPPORTED_PROTOCOL)));
}

TEST(CurlErrorTest, ThrowIfFailedIgnoresSuccess) { EXPECT_NO_THROW(throw_if_failed(ErrorCode{CURLE_OK}, "curl_easy_perform")); }

TEST(CurlErrorTest, ThrowIfFailedCarriesCodeAndOperation) {
    try {
        throw_if_failed(ErrorCode{CURLE_COULDNT_CONNECT}, "curl_easy_perform");
        FAIL() << "expected CurlError";
    } catch (const CurlError& e) {
        EXPECT_EQ(e.code_.value(), CURLE_COULDNT_CONNECT);
        EXPECT_EQ(e.operation_, "curl_easy_perform");
        EXPECT_EQ(std::string(e.what()), std::string("curl_easy_perform failed: ") + curl_easy_strerror(CURLE_COULDNT_CONNECT));
    }
}

TEST(CurlErrorTest, DetailOverridesGenericDescription) {
    try {
        throw_if_failed(ErrorCode{CURLE_COULDNT_RESOLVE_HOST}, "curl_easy_perform", "Could not resolve host: nowhere");
        FAIL() << "expected CurlError";
    } catch (const CurlError& e) {
        EXPECT_EQ(std::string(e.what()), "curl_easy_perform failed: Could not resolve host: nowhere");
    }
}

TEST(CurlErrorTest, EmptyDetailFallsBackToDescription) {
    try {
        throw_if_failed(ErrorCode{CURLE_READ_ERROR}, "curl_easy_perform", "");
        FAIL() << "expected CurlError";
    } catch (const CurlError& e) {
        EXPECT_EQ(std::string(e.what()), std::string("curl_easy_perform failed: ") + curl_easy_strerror(CURLE_READ_ERROR));
    }
}
