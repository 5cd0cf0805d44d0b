#include "bounded_cache/types.hpp"

#include <chrono>
#include <functional>
#include <string_view>

namespace bounded_cache {

Metric wall_clock_seconds() {
  return static_cast<Metric>(std::chrono::duration_cast<std::chrono::seconds>(
                                 Clock::now().time_since_epoch())
                                 .count());
}

TimeSource default_time_source() { return &wall_clock_seconds; }

Key key_from_string(std::string_view text) {
  return static_cast<Key>(std::hash<std::string_view>{}(text));
}

} // namespace bounded_cache
