#include <string>

#include <gtest/gtest.h>

#include <gelfmover/sink/http.hpp>

#include "helpers.hpp"

using namespace gelfmover;


TEST(HttpTest, BuildsPostRequest) {
    const auto raw = sink::http::build_post_request("sentry.io", "/api/1/store/", {{"X-Sentry-Auth", "Sentry sentry_key=k"}}, R"({"a":1})");
    const auto request = std::string(raw.begin(), raw.end());

    EXPECT_TRUE(request.starts_with("POST /api/1/store/ HTTP/1.1\r\n"));
    EXPECT_NE(request.find("Host: sentry.io\r\n"), std::string::npos);
    EXPECT_NE(request.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_NE(request.find("X-Sentry-Auth: Sentry sentry_key=k\r\n"), std::string::npos);
    EXPECT_TRUE(request.ends_with("\r\n\r\n{\"a\":1}"));
}


TEST(HttpTest, ParsesResponse) {
    const auto response = sink::http::parse_response(test::to_bytes(
        "HTTP/1.1 429 Too Many Requests\r\nRetry-After: 30\r\nContent-Type: text/plain\r\n\r\nslow down"));
    EXPECT_EQ(response.status_code, 429);
    EXPECT_EQ(response.headers.at("retry-after"), "30");
    EXPECT_EQ(response.headers.at("content-type"), "text/plain");
    EXPECT_EQ(response.body, "slow down");
}


TEST(HttpTest, ParsesResponseWithoutBody) {
    const auto response = sink::http::parse_response(test::to_bytes("HTTP/1.0 200 OK\r\n\r\n"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_TRUE(response.body.empty());
}


TEST(HttpTest, RejectsMalformedStatusLine) {
    EXPECT_THROW(static_cast<void>(sink::http::parse_response(test::to_bytes(""))), std::runtime_error);
    EXPECT_THROW(static_cast<void>(sink::http::parse_response(test::to_bytes("SMTP 220 ready\r\n\r\n"))), std::runtime_error);
    EXPECT_THROW(static_cast<void>(sink::http::parse_response(test::to_bytes("HTTP/1.1 2x0 OK\r\n\r\n"))), std::runtime_error);
}
