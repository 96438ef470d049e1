#include "common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace tsdsep {

namespace {
constexpr const char* kLoggerName = "tsdsep";
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;

    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

spdlog::level::level_enum levelForVerbosity(int verbosity) {
    if (verbosity <= 0) return spdlog::level::warn;
    if (verbosity == 1) return spdlog::level::debug;
    return spdlog::level::trace;
}

} // namespace tsdsep
