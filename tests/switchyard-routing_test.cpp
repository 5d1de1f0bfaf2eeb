#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/router-config.hpp"
#include "switchyard/test_server_fixture.hpp"
#include "switchyard/test_util.hpp"

using namespace switchyard;

namespace {

constexpr std::string_view kHelloPage = "<html><body><h1>Hello, world!</h1></body></html>";

struct Site {
  void index(const HttpRequest&, HttpResponseWriter& writer) { writer.contentType("text/html").send(kHelloPage); }

  void hello(const HttpRequest& request, HttpResponseWriter& writer) {
    writer.contentType("text/plain")
        .send(std::string(*request.pathParam("first_name")) + "," + std::string(*request.pathParam("last_name")));
  }
};

}  // namespace

TEST(SwitchyardRouting, HelloWorld) {
  test::TestServer<Site> ts;
  ts.router().get("/", &Site::index);
  ts.start();

  const auto resp = test::get(ts.port(), "/");
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.header("Content-Type"), "text/html");
  EXPECT_EQ(resp.body, kHelloPage);
}

TEST(SwitchyardRouting, PathParameters) {
  test::TestServer<Site> ts;
  ts.router().get("/hello/:first_name/:last_name", &Site::hello);
  ts.start();

  auto resp = test::get(ts.port(), "/hello/Jane/Doe");
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "Jane,Doe");

  // percent-decoded, query ignored
  resp = test::get(ts.port(), "/hello/Mary%20Ann/Smith?lang=en");
  EXPECT_EQ(resp.body, "Mary Ann,Smith");

  resp = test::get(ts.port(), "/hello");
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.body, "Not Found");

  resp = test::get(ts.port(), "/hello/Jane/Doe/extra");
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
}

TEST(SwitchyardRouting, EncodedQuestionMarkStaysInParameter) {
  test::TestServer<Site> ts;
  ts.router().get("/hello/:first_name/:last_name", &Site::hello);
  ts.start();

  EXPECT_EQ(test::get(ts.port(), "/hello/what%3F/Doe").body, "what?,Doe");
  EXPECT_EQ(test::get(ts.port(), "/hello/%3Fx/Doe?lang=en").body, "?x,Doe");
}

TEST(SwitchyardRouting, MethodMismatchIsNotFound) {
  test::TestServer<Site> ts;
  ts.router().get("/", &Site::index);
  ts.start();

  test::RequestOptions opt;
  opt.method = "POST";
  opt.body = "x=1";
  EXPECT_EQ(test::request(ts.port(), opt).statusCode, http::StatusCodeNotFound);
}

TEST(SwitchyardRouting, HeadFallsBackToGetWithoutBody) {
  test::TestServer<Site> ts;
  ts.router().get("/", &Site::index);
  ts.start();

  test::RequestOptions opt;
  opt.method = "HEAD";
  const auto resp = test::request(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.header("Content-Length"), std::to_string(kHelloPage.size()));
  EXPECT_TRUE(resp.body.empty());
}

TEST(SwitchyardRouting, FirstRegisteredWins) {
  test::TestServer<Site> ts;
  ts.router()
      .get("/dup", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("first"); })
      .get("/dup", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("second"); })
      .get("/users/:id", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("param"); })
      .get("/users/me", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("literal"); });
  ts.start();

  EXPECT_EQ(test::get(ts.port(), "/dup").body, "first");
  EXPECT_EQ(test::get(ts.port(), "/dup").body, "first");
  EXPECT_EQ(test::get(ts.port(), "/users/me").body, "param");
}

TEST(SwitchyardRouting, MostSpecificPolicy) {
  test::TestServer<Site> ts(test::TestServer<Site>::DefaultConfig(),
                            RouterConfig{}.withMatchPolicy(RouterConfig::MatchPolicy::MostSpecific));
  ts.router()
      .get("/users/:id", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("param"); })
      .get("/users/me", [](Site&, const HttpRequest&, HttpResponseWriter& writer) { writer.send("literal"); });
  ts.start();

  EXPECT_EQ(test::get(ts.port(), "/users/me").body, "literal");
  EXPECT_EQ(test::get(ts.port(), "/users/42").body, "param");
}

TEST(SwitchyardRouting, RoutesFrozenWhileServing) {
  test::TestServer<Site> ts;
  ts.router().get("/", &Site::index);
  ts.start();
  // wait until a request was served, the server is then running
  ASSERT_EQ(test::get(ts.port(), "/").statusCode, http::StatusCodeOK);
  EXPECT_THROW(ts.router(), std::logic_error);
  ts.stop();
  EXPECT_NO_THROW(ts.router());
}
