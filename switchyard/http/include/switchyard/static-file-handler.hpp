#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"

namespace switchyard {

// Serves files below a root directory, usable as a static handler of a mount point:
//   router.mountStatic("/static", StaticFileHandler("web"));
// The file is designated by the wildcard remainder of the route ("/static/css/site.css" -> "web/css/site.css"),
// or by the whole request path when the route has no wildcard.
// Paths escaping the root ("..") and missing files give a 404. A directory is served through its index file.
class StaticFileHandler {
 public:
  explicit StaticFileHandler(std::filesystem::path rootDirectory, std::string defaultIndex = "index.html");

  void operator()(const HttpRequest& request, HttpResponseWriter& writer) const;

  // File to serve for 'relativePath' (segments separated by '/'), or std::nullopt if there is none.
  [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view relativePath) const;

 private:
  std::filesystem::path _root;
  std::string _defaultIndex;
};

}  // namespace switchyard
