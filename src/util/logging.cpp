#include "bounded_cache/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>

namespace bounded_cache {
namespace {
constexpr const char *kLoggerName = "bounded_cache";
std::mutex logger_mutex;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex);
  auto existing = spdlog::get(kLoggerName);
  if (existing)
    return existing;
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_level(spdlog::level::info);
  return created;
}

void init_logging(spdlog::level::level_enum level) { logger()->set_level(level); }

namespace detail {

void check_failed(const char *condition, const char *message, const char *file,
                  int line) {
  auto log = logger();
  log->critical("invariant violated: {} ({}) at {}:{}", message, condition,
                file, line);
  log->flush();
  std::abort();
}

} // namespace detail
} // namespace bounded_cache
