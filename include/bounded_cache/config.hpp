#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bounded_cache {

struct CacheConfig {
  std::size_t max_items{1024};
  std::int64_t lifetime_s{300};
  std::int64_t empty_lifetime_s{60};
  std::string policy{"lru"};
  std::string log_level{"info"};
};

// Reads fields of a flat JSON object into cfg, clamping numbers into range.
// Fields that are absent keep their current value. cfg is left untouched
// when the text is not an object.
bool parse_config(const std::string &text, CacheConfig &cfg,
                  std::string *err = nullptr);

bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err = nullptr);

// Applies cfg.log_level to the library logger.
bool apply_log_level(const CacheConfig &cfg, std::string *err = nullptr);

} // namespace bounded_cache
