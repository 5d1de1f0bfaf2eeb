#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace switchyard {

// All switchyard components log through this alias so that the process owning the server
// configures a single spdlog default logger (level, sinks, pattern).
namespace log = spdlog;

}  // namespace switchyard
