#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/http-method.hpp"
#include "switchyard/path-param-capture.hpp"
#include "switchyard/router-config.hpp"

namespace switchyard {

// Maps (method, path pattern) to a route index, and resolves request paths into a route plus its path
// parameters.
//
// Pattern syntax, segments separated by '/' (empty segments ignored):
//   - "users"    literal, must equal the path segment exactly
//   - ":id"      parameter, matches any single non-empty segment and binds it under "id"
//   - "*"        wildcard, only in last position: matches zero or more trailing segments and binds them
//                joined with '/' under kWildcardParamKey
// Matching works on the decoded request path, the query string being already removed from it: a '?' in the
// path comes from an encoded "%3F" and belongs to its segment.
//
// Routes are only added before serving starts, lookups are then concurrent and read-only.
// Lookup is a linear scan over the routes of the requested method.
class RouteTable {
 public:
  using RouteIdx = uint32_t;

  enum class SegmentKind : uint8_t { Literal, Param, Wildcard };

  struct Segment {
    SegmentKind kind;
    std::string text;  // literal value or parameter name
  };

  struct Match {
    RouteIdx routeIdx;
    std::vector<PathParamCapture> params;  // in pattern order
    std::string matchedPath;               // the matched request path
  };

  RouteTable() = default;

  explicit RouteTable(RouterConfig config) : _config(config) {}

  // Registers 'pattern' for 'method' and returns the index of the route serving it.
  // If the same method and pattern were already registered, returns the existing index (KeepFirst policy)
  // or throws std::logic_error (Throw policy).
  // Throws std::invalid_argument for malformed patterns.
  RouteIdx add(http::Method method, std::string_view pattern);

  // Registers a mount point: 'prefix' followed by a wildcard.
  RouteIdx addMount(http::Method method, std::string_view prefix);

  // Finds the route serving the decoded 'path' for 'method', or std::nullopt for a routing miss.
  [[nodiscard]] std::optional<Match> match(http::Method method, std::string_view path) const;

  // Number of distinct routes, which are indexed from 0 in registration order.
  [[nodiscard]] RouteIdx size() const noexcept { return _nbRoutes; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Parses a pattern into segments. Throws std::invalid_argument if it is malformed.
  static std::vector<Segment> ParsePattern(std::string_view pattern);

 private:
  struct CompiledRoute {
    std::vector<Segment> segments;
    RouteIdx routeIdx;
    bool hasWildcard;
  };

  RouteIdx addCompiled(http::Method method, std::string_view pattern, std::vector<Segment> segments);

  [[nodiscard]] const CompiledRoute* findBest(http::Method method,
                                              const std::vector<std::string_view>& pathSegments) const;

  std::array<std::vector<CompiledRoute>, http::kNbMethods> _routesPerMethod;
  RouterConfig _config;
  RouteIdx _nbRoutes{0};
};

}  // namespace switchyard
