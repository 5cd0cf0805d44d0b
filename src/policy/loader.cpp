#include "bounded_cache/loader.hpp"

#include "bounded_cache/logging.hpp"

#include <stdexcept>
#include <utility>

namespace bounded_cache {

CachingLoader::CachingLoader(Cache &cache, Fetch fetch, bool cache_empty_values)
    : cache_(cache), fetch_(std::move(fetch)),
      cache_empty_values_(cache_empty_values), log_(logger()) {
  if (!fetch_)
    throw std::invalid_argument("caching loader needs a fetch function");
}

const CachingLoader::Bytes *CachingLoader::load(Key key) {
  if (const DynamicValue *hit = cache_.get(key)) {
    copy_ = hit->bytes;
    return result();
  }

  ++fetches_;
  auto data = fetch_(key);
  if (!data) {
    log_->debug("source unavailable for key {}", key);
    copy_.clear();
    return nullptr;
  }
  if (data->empty() && !cache_empty_values_) {
    copy_.clear();
    return nullptr;
  }
  if (DynamicValue *slot = cache_.create(key))
    slot->assign(*data);
  else
    log_->debug("cache declined key {}", key);
  copy_ = std::move(*data);
  return result();
}

const CachingLoader::Bytes *CachingLoader::result() {
  return copy_.empty() ? nullptr : &copy_;
}

} // namespace bounded_cache
