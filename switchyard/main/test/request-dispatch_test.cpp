#include "switchyard/request-dispatch.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "switchyard/http-error.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/string-sink.hpp"

namespace switchyard {

class RequestDispatchTest : public ::testing::Test {
 protected:
  std::string run(const DispatchTask& task, std::string_view rawRequest = "POST /form HTTP/1.1\r\n\r\n") {
    auto request = test::MakeRequest(rawRequest);
    HttpResponseWriter writer(sink, {});
    RunDispatchTask(task, request, writer);
    EXPECT_FALSE(writer.isBuilding());
    return sink->out();
  }

  std::shared_ptr<test::StringSink> sink = std::make_shared<test::StringSink>();
};

TEST_F(RequestDispatchTest, TaskResponseIsKept) {
  const auto out = run([](HttpRequest&, HttpResponseWriter& writer) { writer.contentType("text/plain").send("ok"); });
  EXPECT_TRUE(out.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(out.ends_with("ok"));
  EXPECT_EQ(sink->nbCompletions(), 1);
}

TEST_F(RequestDispatchTest, UnsentResponseIsCommitted) {
  const auto out = run([](HttpRequest&, HttpResponseWriter& writer) { writer.status(http::StatusCodeCreated); });
  EXPECT_EQ(out, "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
}

TEST_F(RequestDispatchTest, HttpErrorGivesItsStatus) {
  const auto out = run([](HttpRequest&, HttpResponseWriter& writer) {
    writer.contentType("text/html");
    throw HttpError(http::StatusCodeForbidden, "Access denied");
  });
  EXPECT_TRUE(out.starts_with("HTTP/1.1 403 Forbidden\r\nContent-Type: text/plain\r\n"));
  EXPECT_TRUE(out.ends_with("\r\n\r\nAccess denied"));
}

TEST_F(RequestDispatchTest, MalformedFormGives400) {
  const auto out = run(
      [](HttpRequest& request, HttpResponseWriter& writer) {
        const auto form = request.form();
        writer.send(std::string(form.value("name").value_or("")));
      },
      "POST /form HTTP/1.1\r\nContent-Type: application/x-www-form-urlencoded\r\nContent-Length: 8\r\n\r\n"
      "name=%zz");
  EXPECT_TRUE(out.starts_with("HTTP/1.1 400 Bad Request\r\n"));
  EXPECT_TRUE(out.ends_with("Malformed form data"));
}

TEST_F(RequestDispatchTest, OtherExceptionsGive500) {
  const auto out = run([](HttpRequest&, HttpResponseWriter&) { throw std::runtime_error("database down"); });
  EXPECT_TRUE(out.starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
  EXPECT_EQ(out.find("database down"), std::string::npos);
}

TEST_F(RequestDispatchTest, NonStandardExceptionGives500) {
  const auto out = run([](HttpRequest&, HttpResponseWriter&) { throw 42; });
  EXPECT_TRUE(out.starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
  EXPECT_EQ(sink->nbCompletions(), 1);
}

TEST_F(RequestDispatchTest, ErrorAfterCommitOnlyLogged) {
  const auto out = run([](HttpRequest&, HttpResponseWriter& writer) {
    writer.send("done");
    throw std::runtime_error("late failure");
  });
  EXPECT_TRUE(out.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_EQ(sink->nbCompletions(), 1);
}

TEST_F(RequestDispatchTest, ErrorWhileStreamingOnlyLogged) {
  const auto out = run([](HttpRequest&, HttpResponseWriter& writer) {
    auto stream = writer.stream();
    stream.append("partial");
    throw HttpError(http::StatusCodeBadRequest, "too late");
  });
  EXPECT_TRUE(out.ends_with("7\r\npartial\r\n0\r\n\r\n"));
  EXPECT_EQ(out.find("too late"), std::string::npos);
  EXPECT_EQ(sink->nbCompletions(), 1);
}

}  // namespace switchyard
