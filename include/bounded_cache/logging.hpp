#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace bounded_cache {

// Returns the "bounded_cache" logger, registering a stderr logger on first use.
std::shared_ptr<spdlog::logger> logger();

void init_logging(spdlog::level::level_enum level);

namespace detail {

[[noreturn]] void check_failed(const char *condition, const char *message,
                               const char *file, int line);

} // namespace detail

} // namespace bounded_cache

// Index/slot desynchronization is not recoverable.
#define BOUNDED_CACHE_CHECK(cond, msg)                                         \
  do {                                                                         \
    if (!(cond))                                                               \
      ::bounded_cache::detail::check_failed(#cond, msg, __FILE__, __LINE__);   \
  } while (0)
