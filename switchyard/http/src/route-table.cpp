#include "switchyard/route-table.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/http-method.hpp"
#include "switchyard/log.hpp"
#include "switchyard/path-param-capture.hpp"
#include "switchyard/path-segments.hpp"

namespace switchyard {

namespace {

bool SameSegments(const std::vector<RouteTable::Segment>& lhs, const std::vector<RouteTable::Segment>& rhs) {
  // Parameter names do not matter: "/a/:x" and "/a/:y" serve exactly the same paths.
  return std::ranges::equal(lhs, rhs, [](const RouteTable::Segment& left, const RouteTable::Segment& right) {
    return left.kind == right.kind && (left.kind != RouteTable::SegmentKind::Literal || left.text == right.text);
  });
}

bool SegmentsMatch(const std::vector<RouteTable::Segment>& segments, bool hasWildcard,
                   const std::vector<std::string_view>& pathSegments) {
  const std::size_t nbFixed = hasWildcard ? segments.size() - 1U : segments.size();
  if (hasWildcard ? pathSegments.size() < nbFixed : pathSegments.size() != nbFixed) {
    return false;
  }
  for (std::size_t pos = 0; pos < nbFixed; ++pos) {
    if (segments[pos].kind == RouteTable::SegmentKind::Literal && segments[pos].text != pathSegments[pos]) {
      return false;
    }
  }
  return true;
}

int SegmentRank(RouteTable::SegmentKind kind) {
  switch (kind) {
    case RouteTable::SegmentKind::Literal:
      return 2;
    case RouteTable::SegmentKind::Param:
      return 1;
    default:
      return 0;
  }
}

// True if 'lhs' is strictly more specific than 'rhs', both matching the same path.
bool MoreSpecific(const std::vector<RouteTable::Segment>& lhs, bool lhsWildcard,
                  const std::vector<RouteTable::Segment>& rhs, bool rhsWildcard) {
  const std::size_t commonSize = std::min(lhs.size(), rhs.size());
  for (std::size_t pos = 0; pos < commonSize; ++pos) {
    const int lhsRank = SegmentRank(lhs[pos].kind);
    const int rhsRank = SegmentRank(rhs[pos].kind);
    if (lhsRank != rhsRank) {
      return lhsRank > rhsRank;
    }
  }
  if (lhsWildcard != rhsWildcard) {
    return !lhsWildcard;
  }
  return lhs.size() > rhs.size();
}

}  // namespace

std::vector<RouteTable::Segment> RouteTable::ParsePattern(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern must start with '/': '" + std::string(pattern) + "'");
  }
  std::vector<std::string_view> rawSegments;
  SplitPathSegments(pattern, rawSegments);

  std::vector<Segment> segments;
  segments.reserve(rawSegments.size());
  for (std::size_t pos = 0; pos < rawSegments.size(); ++pos) {
    const std::string_view raw = rawSegments[pos];
    if (raw == "*") {
      if (pos + 1U != rawSegments.size()) {
        throw std::invalid_argument("Wildcard is only allowed as last segment in '" + std::string(pattern) + "'");
      }
      segments.emplace_back(SegmentKind::Wildcard, std::string(kWildcardParamKey));
    } else if (raw.front() == ':') {
      std::string name(raw.substr(1));
      if (name.empty()) {
        throw std::invalid_argument("Empty parameter name in '" + std::string(pattern) + "'");
      }
      if (std::ranges::any_of(segments, [&name](const Segment& seg) {
            return seg.kind == SegmentKind::Param && seg.text == name;
          })) {
        throw std::invalid_argument("Duplicated parameter '" + name + "' in '" + std::string(pattern) + "'");
      }
      segments.emplace_back(SegmentKind::Param, std::move(name));
    } else {
      segments.emplace_back(SegmentKind::Literal, std::string(raw));
    }
  }
  return segments;
}

RouteTable::RouteIdx RouteTable::add(http::Method method, std::string_view pattern) {
  return addCompiled(method, pattern, ParsePattern(pattern));
}

RouteTable::RouteIdx RouteTable::addMount(http::Method method, std::string_view prefix) {
  std::vector<Segment> segments = ParsePattern(prefix);
  if (segments.empty() || segments.back().kind != SegmentKind::Wildcard) {
    segments.emplace_back(SegmentKind::Wildcard, std::string(kWildcardParamKey));
  }
  return addCompiled(method, prefix, std::move(segments));
}

RouteTable::RouteIdx RouteTable::addCompiled(http::Method method, std::string_view pattern,
                                             std::vector<Segment> segments) {
  auto& routes = _routesPerMethod[http::MethodToIdx(method)];
  const bool hasWildcard = !segments.empty() && segments.back().kind == SegmentKind::Wildcard;

  const auto existingIt = std::ranges::find_if(routes, [&](const CompiledRoute& route) {
    return route.hasWildcard == hasWildcard && SameSegments(route.segments, segments);
  });
  if (existingIt != routes.end()) {
    if (_config.duplicatePolicy == RouterConfig::DuplicatePolicy::Throw) {
      throw std::logic_error("Route " + std::string(http::MethodToStr(method)) + " '" + std::string(pattern) +
                             "' is already registered");
    }
    log::warn("Route {} '{}' is already registered, keeping the first registration", http::MethodToStr(method),
              pattern);
    return existingIt->routeIdx;
  }

  const RouteIdx routeIdx = _nbRoutes++;
  routes.emplace_back(std::move(segments), routeIdx, hasWildcard);
  log::debug("Registered route #{} {} '{}'", routeIdx, http::MethodToStr(method), pattern);
  return routeIdx;
}

const RouteTable::CompiledRoute* RouteTable::findBest(http::Method method,
                                                      const std::vector<std::string_view>& pathSegments) const {
  const CompiledRoute* pBest = nullptr;
  for (const CompiledRoute& route : _routesPerMethod[http::MethodToIdx(method)]) {
    if (!SegmentsMatch(route.segments, route.hasWildcard, pathSegments)) {
      continue;
    }
    if (_config.matchPolicy == RouterConfig::MatchPolicy::FirstRegistered) {
      return &route;
    }
    if (pBest == nullptr || MoreSpecific(route.segments, route.hasWildcard, pBest->segments, pBest->hasWildcard)) {
      pBest = &route;
    }
  }
  return pBest;
}

std::optional<RouteTable::Match> RouteTable::match(http::Method method, std::string_view path) const {
  std::vector<std::string_view> pathSegments;
  SplitPathSegments(path, pathSegments);

  const CompiledRoute* pRoute = findBest(method, pathSegments);
  if (pRoute == nullptr && method == http::Method::HEAD && _config.headFallbackToGet) {
    pRoute = findBest(http::Method::GET, pathSegments);
  }
  if (pRoute == nullptr) {
    return std::nullopt;
  }

  Match result{pRoute->routeIdx, {}, std::string(path)};
  for (std::size_t pos = 0; pos < pRoute->segments.size(); ++pos) {
    const Segment& segment = pRoute->segments[pos];
    if (segment.kind == SegmentKind::Param) {
      result.params.emplace_back(segment.text, std::string(pathSegments[pos]));
    } else if (segment.kind == SegmentKind::Wildcard) {
      std::string remainder;
      for (std::size_t restPos = pos; restPos < pathSegments.size(); ++restPos) {
        if (restPos != pos) {
          remainder.push_back('/');
        }
        remainder.append(pathSegments[restPos]);
      }
      result.params.emplace_back(segment.text, std::move(remainder));
    }
  }
  return result;
}

}  // namespace switchyard
