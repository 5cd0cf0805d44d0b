#include "bounded_cache/config.hpp"

#include "bounded_cache/logging.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace bounded_cache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = std::stoll(m[1].str());
  } catch (const std::out_of_range &) {
    out = m[1].str().front() == '-' ? INT64_MIN : INT64_MAX;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}

constexpr std::int64_t kMaxItems = std::int64_t{1} << 31;
constexpr std::int64_t kMaxLifetime = std::int64_t{10} * 365 * 24 * 3600;
} // namespace

bool parse_config(const std::string &text, CacheConfig &cfg, std::string *err) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig next = cfg;
  std::int64_t n;
  std::string s;
  if (extract_i64(text, "max_items", n))
    next.max_items =
        static_cast<std::size_t>(std::clamp<std::int64_t>(n, 1, kMaxItems));
  if (extract_i64(text, "lifetime_s", n))
    next.lifetime_s = std::clamp<std::int64_t>(n, 1, kMaxLifetime);
  if (extract_i64(text, "empty_lifetime_s", n))
    next.empty_lifetime_s = std::clamp<std::int64_t>(n, 1, kMaxLifetime);
  if (extract_string(text, "policy", s)) {
    if (s != "priority" && s != "access" && s != "lru") {
      if (err)
        *err = "unknown policy " + s;
      return false;
    }
    next.policy = s;
  }
  if (extract_string(text, "log_level", s))
    next.log_level = s;

  cfg = std::move(next);
  return true;
}

bool load_config(const std::string &path, CacheConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), cfg, err)) {
    logger()->warn("rejected config {}", path);
    return false;
  }
  logger()->debug("loaded config {}", path);
  return true;
}

bool apply_log_level(const CacheConfig &cfg, std::string *err) {
  const auto level = spdlog::level::from_str(cfg.log_level);
  if (level == spdlog::level::off && cfg.log_level != "off") {
    if (err)
      *err = "unknown log level " + cfg.log_level;
    return false;
  }
  init_logging(level);
  return true;
}

} // namespace bounded_cache
