#include "bounded_cache/policy.hpp"

#include <string>

namespace bounded_cache {

PolicyKind policy_kind_from_name(const std::string &name) {
  if (name == "priority")
    return PolicyKind::Priority;
  if (name == "access")
    return PolicyKind::Access;
  return PolicyKind::Lru;
}

const char *policy_name(PolicyKind kind) {
  switch (kind) {
  case PolicyKind::Priority:
    return "priority";
  case PolicyKind::Access:
    return "access";
  case PolicyKind::Lru:
    return "lru";
  }
  return "lru";
}

} // namespace bounded_cache
