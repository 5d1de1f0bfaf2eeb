#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string_view>
#include <system_error>

namespace switchyard {

// Captures errno immediately and throws std::system_error with a formatted message.
// Usage: throw_errno("bind failed for port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view format, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          fmt::vformat(format, fmt::make_format_args(args...)));
}

}  // namespace switchyard
