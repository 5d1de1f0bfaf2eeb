#pragma once

#include <cstdint>

namespace switchyard {

// Routing policies, fixed before serving starts.
struct RouterConfig {
  // Selection among several routes matching the same request path.
  enum class MatchPolicy : std::uint8_t {
    // The first matching route in registration order.
    FirstRegistered,
    // Literal segments beat parameters, which beat wildcards, compared from the first segment.
    // An exact route beats a wildcard route matching zero trailing segments. Ties keep registration order.
    MostSpecific
  };

  // What happens when the same method and pattern are registered twice.
  enum class DuplicatePolicy : std::uint8_t {
    // The first registration keeps serving, the new one is dropped with a warning.
    KeepFirst,
    // std::logic_error is thrown.
    Throw
  };

  MatchPolicy matchPolicy{MatchPolicy::FirstRegistered};

  DuplicatePolicy duplicatePolicy{DuplicatePolicy::KeepFirst};

  // A HEAD request without a HEAD route is served by the GET route, with the body suppressed.
  bool headFallbackToGet{true};

  RouterConfig& withMatchPolicy(MatchPolicy policy) {
    matchPolicy = policy;
    return *this;
  }

  RouterConfig& withDuplicatePolicy(DuplicatePolicy policy) {
    duplicatePolicy = policy;
    return *this;
  }

  RouterConfig& withHeadFallbackToGet(bool enable = true) {
    headFallbackToGet = enable;
    return *this;
  }

  bool operator==(const RouterConfig&) const noexcept = default;
};

}  // namespace switchyard
