#pragma once

#include "bounded_cache/expiring.hpp"
#include "bounded_cache/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace bounded_cache {

// Read-through access to an external record source. Records are kept in an
// expiring cache; a missing or expired record is fetched again. A source
// answer of "no such record" is cached as an empty value, which expires after
// the cache's empty lifetime.
class CachingLoader {
public:
  using Cache = ExpiringAccessCache<DynamicValue>;
  using Bytes = std::vector<std::uint8_t>;
  // Returns the record, an empty record when the source has none, or nullopt
  // when the source could not be asked. May throw.
  using Fetch = std::function<std::optional<Bytes>(Key)>;

  CachingLoader(Cache &cache, Fetch fetch, bool cache_empty_values = true);

  // Returns the record for key, or nullptr when there is none. The result
  // points to a loader-local copy that stays valid until the next load(), so
  // it survives evictions done by other users of the same cache.
  const Bytes *load(Key key);

  void set_cache_empty_values(bool enabled) { cache_empty_values_ = enabled; }
  std::uint64_t fetches() const { return fetches_; }
  Cache &cache() { return cache_; }

private:
  const Bytes *result();

  Cache &cache_;
  Fetch fetch_;
  bool cache_empty_values_;
  Bytes copy_;
  std::uint64_t fetches_{0};
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace bounded_cache
