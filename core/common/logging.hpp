#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include <memory>

namespace tsdsep {

/// Shared "tsdsep" logger, created on first use with a stdout sink.
std::shared_ptr<spdlog::logger> logger();

/// Map an integer verbosity onto a logger level.
/// 0 → warn, 1 → debug, 2 and above → trace.
spdlog::level::level_enum levelForVerbosity(int verbosity);

} // namespace tsdsep
