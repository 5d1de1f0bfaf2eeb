#pragma once

#include <cstdint>
#include <string_view>

#include "switchyard/http-constants.hpp"

namespace switchyard::http {

enum class Version : uint8_t { Http10, Http11 };

constexpr std::string_view VersionToStr(Version version) { return version == Version::Http10 ? HTTP10Sv : HTTP11Sv; }

}  // namespace switchyard::http
