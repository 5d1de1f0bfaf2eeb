#pragma once

#include <bit>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace switchyard::http {

// Methods that can be routed. Each one is a single bit so that indexes can be derived with countr_zero.
enum class Method : uint8_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 5;

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET", "HEAD", "POST", "PUT", "DELETE"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Method tokens are case sensitive.
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace switchyard::http
