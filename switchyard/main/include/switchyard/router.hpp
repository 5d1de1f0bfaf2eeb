#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "switchyard/http-method.hpp"
#include "switchyard/path-handlers.hpp"
#include "switchyard/path-param-capture.hpp"
#include "switchyard/route-table.hpp"
#include "switchyard/router-config.hpp"

namespace switchyard {

// Registry of the handlers of a server whose per-request application type is App.
//
// Every route is registered before serving starts. Once the server runs, the router is frozen and shared
// read-only between all listener and worker threads.
template <class App>
class Router {
 public:
  struct RoutingResult {
    // Never null.
    const HandlerDescriptor<App>* pHandler;
    // Path parameters in pattern order, the wildcard remainder under kWildcardParamKey.
    std::vector<PathParamCapture> params;
    std::string matchedPath;
  };

  Router() = default;

  explicit Router(RouterConfig config) : _routeTable(config) {}

  // Registers 'handler' for 'method' and 'pattern' (see RouteTable for the pattern syntax).
  // When the same method and pattern are registered twice, the first handler keeps serving
  // (or std::logic_error is thrown, depending on RouterConfig::duplicatePolicy).
  // Throws std::invalid_argument for malformed patterns or an empty handler.
  Router& setPath(http::Method method, std::string_view pattern, InstanceHandler<App> handler) {
    return store(method, pattern, false, HandlerDescriptor<App>(std::move(handler)));
  }

  // Registers a handler called without application instance.
  Router& setPath(http::Method method, std::string_view pattern, StaticHandler handler) {
    return store(method, pattern, false, HandlerDescriptor<App>(std::move(handler)));
  }

  Router& get(std::string_view pattern, InstanceHandler<App> handler) {
    return setPath(http::Method::GET, pattern, std::move(handler));
  }

  Router& post(std::string_view pattern, InstanceHandler<App> handler) {
    return setPath(http::Method::POST, pattern, std::move(handler));
  }

  Router& put(std::string_view pattern, InstanceHandler<App> handler) {
    return setPath(http::Method::PUT, pattern, std::move(handler));
  }

  Router& del(std::string_view pattern, InstanceHandler<App> handler) {
    return setPath(http::Method::DELETE, pattern, std::move(handler));
  }

  Router& head(std::string_view pattern, InstanceHandler<App> handler) {
    return setPath(http::Method::HEAD, pattern, std::move(handler));
  }

  // Mounts 'handler' on GET 'prefix' and everything below it. The handler finds the remainder of the path
  // in the kWildcardParamKey path parameter ("/static/css/site.css" -> "css/site.css" for prefix "/static").
  Router& mountStatic(std::string_view prefix, StaticHandler handler) {
    return store(http::Method::GET, prefix, true, HandlerDescriptor<App>(std::move(handler)));
  }

  // Replaces the hook called on each application instance before its route handler.
  // An empty middleware restores the default no-op.
  Router& setMiddleware(Middleware<App> middleware) {
    _middleware = std::move(middleware);
    return *this;
  }

  [[nodiscard]] const Middleware<App>& middleware() const noexcept { return _middleware; }

  // Resolves the handler for 'method' and 'path', or std::nullopt for a routing miss.
  [[nodiscard]] std::optional<RoutingResult> match(http::Method method, std::string_view path) const {
    auto routeMatch = _routeTable.match(method, path);
    if (!routeMatch) {
      return std::nullopt;
    }
    return RoutingResult{&_handlers[routeMatch->routeIdx], std::move(routeMatch->params),
                         std::move(routeMatch->matchedPath)};
  }

  // Number of registered routes.
  [[nodiscard]] std::size_t size() const noexcept { return _handlers.size(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _routeTable.config(); }

 private:
  Router& store(http::Method method, std::string_view pattern, bool mount, HandlerDescriptor<App> handler) {
    const bool emptyHandler = std::visit([](const auto& callable) { return !callable; }, handler);
    if (emptyHandler) {
      throw std::invalid_argument("Cannot register an empty handler for '" + std::string(pattern) + "'");
    }
    const auto routeIdx = mount ? _routeTable.addMount(method, pattern) : _routeTable.add(method, pattern);
    // Existing index: duplicate kept first, the new handler is dropped.
    if (routeIdx == _handlers.size()) {
      _handlers.push_back(std::move(handler));
    }
    return *this;
  }

  RouteTable _routeTable;
  std::vector<HandlerDescriptor<App>> _handlers;
  Middleware<App> _middleware;
};

}  // namespace switchyard
