#include "switchyard/http-request-parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/http-version.hpp"

namespace switchyard {

using Status = HttpRequestParser::Status;

class HttpRequestParserTest : public ::testing::Test {
 protected:
  HttpRequestParser::Result parse(std::string_view raw) { return parser.parse(raw, request); }

  HttpRequestParser parser{256, 64};
  HttpRequest request;
};

TEST_F(HttpRequestParserTest, SimpleGet) {
  const std::string_view raw = "GET /hello/Jane%20Doe?lang=en&x=a+b HTTP/1.1\r\nHost: localhost\r\n\r\n";
  const auto result = parse(raw);
  ASSERT_EQ(result.status, Status::Complete);
  EXPECT_EQ(result.consumedBytes, raw.size());
  EXPECT_EQ(request.method(), http::Method::GET);
  EXPECT_EQ(request.version(), http::Version::Http11);
  EXPECT_EQ(request.target(), "/hello/Jane%20Doe?lang=en&x=a+b");
  EXPECT_EQ(request.path(), "/hello/Jane Doe");
  EXPECT_EQ(request.queryParamValue("lang"), "en");
  EXPECT_EQ(request.queryParamValue("x"), "a b");
  EXPECT_EQ(request.headerValue("host"), "localhost");
  EXPECT_TRUE(request.body().empty());
}

TEST_F(HttpRequestParserTest, BodyWithContentLength) {
  const std::string_view raw = "POST /form HTTP/1.1\r\nContent-Length: 7\r\n\r\nname=JoGET / HTTP/1.1\r\n\r\n";
  const auto result = parse(raw);
  ASSERT_EQ(result.status, Status::Complete);
  EXPECT_EQ(request.body(), "name=Jo");
  EXPECT_EQ(raw.substr(result.consumedBytes), "GET / HTTP/1.1\r\n\r\n");
}

TEST_F(HttpRequestParserTest, NeedMoreData) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: x\r\n").status, Status::NeedMore);
  EXPECT_EQ(parse("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc").status, Status::NeedMore);
}

TEST_F(HttpRequestParserTest, Http10) {
  ASSERT_EQ(parse("GET / HTTP/1.0\r\n\r\n").status, Status::Complete);
  EXPECT_EQ(request.version(), http::Version::Http10);
  EXPECT_FALSE(request.keepAlive());
}

TEST_F(HttpRequestParserTest, Errors) {
  auto expectError = [this](std::string_view raw, http::StatusCode expected) {
    const auto result = parse(raw);
    EXPECT_EQ(result.status, Status::Error) << raw;
    EXPECT_EQ(result.errorStatus, expected) << raw;
  };
  expectError("GARBAGE\r\n\r\n", http::StatusCodeBadRequest);
  expectError("PATCH / HTTP/1.1\r\n\r\n", http::StatusCodeNotImplemented);
  expectError("GET / HTTP/2.0\r\n\r\n", http::StatusCodeHTTPVersionNotSupported);
  expectError("GET / FTP/1.1\r\n\r\n", http::StatusCodeBadRequest);
  expectError("GET relative HTTP/1.1\r\n\r\n", http::StatusCodeBadRequest);
  expectError("GET /%zz HTTP/1.1\r\n\r\n", http::StatusCodeBadRequest);
  expectError("GET / HTTP/1.1\r\nNoColon\r\n\r\n", http::StatusCodeBadRequest);
  expectError("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n", http::StatusCodeBadRequest);
  expectError("POST / HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n", http::StatusCodeBadRequest);
  expectError("POST / HTTP/1.1\r\nContent-Length: 65\r\n\r\n", http::StatusCodePayloadTooLarge);
  expectError("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n", http::StatusCodeNotImplemented);
}

TEST_F(HttpRequestParserTest, HeaderTooLarge) {
  const std::string longHeader = "GET / HTTP/1.1\r\nX-Big: " + std::string(300, 'a');
  auto result = parse(longHeader);
  EXPECT_EQ(result.status, Status::Error);
  EXPECT_EQ(result.errorStatus, http::StatusCodeRequestHeaderFieldsTooLarge);

  result = parse(longHeader + "\r\n\r\n");
  EXPECT_EQ(result.errorStatus, http::StatusCodeRequestHeaderFieldsTooLarge);
}

TEST_F(HttpRequestParserTest, ReusedRequestIsReset) {
  ASSERT_EQ(parse("GET /a?x=1 HTTP/1.1\r\nA: 1\r\n\r\n").status, Status::Complete);
  request.setAttribute("user", "jane");
  ASSERT_EQ(parse("PUT /b HTTP/1.1\r\n\r\n").status, Status::Complete);
  EXPECT_EQ(request.method(), http::Method::PUT);
  EXPECT_TRUE(request.headers().empty());
  EXPECT_TRUE(request.queryParams().empty());
  EXPECT_FALSE(request.attribute("user"));
}

}  // namespace switchyard
