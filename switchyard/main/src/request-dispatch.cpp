#include "switchyard/request-dispatch.hpp"

#include <exception>
#include <string_view>

#include "switchyard/http-constants.hpp"
#include "switchyard/http-error.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/log.hpp"

namespace switchyard {

namespace {

void SendError(HttpResponseWriter& writer, http::StatusCode statusCode, std::string_view message) noexcept {
  try {
    writer.status(statusCode).header(http::ContentType, http::ContentTypeTextPlain).send(message);
  } catch (const std::exception& ex) {
    log::error("Unable to send error response {}: {}", statusCode, ex.what());
  } catch (...) {
    log::error("Unable to send error response {}", statusCode);
  }
}

}  // namespace

void RunDispatchTask(const DispatchTask& task, HttpRequest& request, HttpResponseWriter& writer) noexcept {
  try {
    task(request, writer);
  } catch (const HttpError& ex) {
    log::debug("{} {} answered with {}: {}", http::MethodToStr(request.method()), request.path(), ex.status(),
               ex.what());
    if (writer.isBuilding()) {
      SendError(writer, ex.status(), ex.what());
    } else {
      log::warn("HttpError {} raised after the response of {} started", ex.status(), request.path());
    }
  } catch (const std::exception& ex) {
    log::error("Exception while handling {} {}: {}", http::MethodToStr(request.method()), request.path(),
               ex.what());
    if (writer.isBuilding()) {
      SendError(writer, http::StatusCodeInternalServerError,
                http::ReasonPhraseFor(http::StatusCodeInternalServerError));
    }
  } catch (...) {
    log::error("Unknown exception while handling {} {}", http::MethodToStr(request.method()), request.path());
    if (writer.isBuilding()) {
      SendError(writer, http::StatusCodeInternalServerError,
                http::ReasonPhraseFor(http::StatusCodeInternalServerError));
    }
  }
  if (writer.isBuilding()) {
    try {
      writer.end();
    } catch (const std::exception& ex) {
      log::error("Unable to commit the response of {}: {}", request.path(), ex.what());
    } catch (...) {
      log::error("Unable to commit the response of {}", request.path());
    }
  }
}

}  // namespace switchyard
