#include "switchyard/static-file-handler.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "switchyard/http-constants.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/log.hpp"
#include "switchyard/path-param-capture.hpp"

namespace switchyard {

StaticFileHandler::StaticFileHandler(std::filesystem::path rootDirectory, std::string defaultIndex)
    : _root(std::move(rootDirectory)), _defaultIndex(std::move(defaultIndex)) {}

std::optional<std::filesystem::path> StaticFileHandler::resolve(std::string_view relativePath) const {
  std::filesystem::path relative;
  while (!relativePath.empty()) {
    const auto slashPos = relativePath.find('/');
    const std::string_view segment = relativePath.substr(0, slashPos);
    if (segment == "..") {
      return std::nullopt;
    }
    if (!segment.empty() && segment != ".") {
      relative /= std::filesystem::path(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    relativePath.remove_prefix(slashPos + 1U);
  }

  std::filesystem::path resolvedPath = _root / relative;
  std::error_code ec;
  if (std::filesystem::is_directory(resolvedPath, ec)) {
    if (_defaultIndex.empty()) {
      return std::nullopt;
    }
    resolvedPath /= _defaultIndex;
  }
  return resolvedPath;
}

void StaticFileHandler::operator()(const HttpRequest& request, HttpResponseWriter& writer) const {
  const std::string_view relativePath = request.pathParam(kWildcardParamKey).value_or(request.path());
  const auto resolvedPath = resolve(relativePath);
  if (!resolvedPath) {
    log::debug("Static: refusing to serve '{}'", relativePath);
    writer.status(http::StatusCodeNotFound)
        .contentType(http::ContentTypeTextPlain)
        .send(http::ReasonPhraseFor(http::StatusCodeNotFound));
    return;
  }
  writer.sendFile(resolvedPath->string());
}

}  // namespace switchyard
