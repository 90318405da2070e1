#include "internal/cache/cache_invalidator.hpp"

#include <stdexcept>

namespace checkout::cache {

std::string VersionKey(std::string_view domain) {
  if (domain == kProductList) return "product:list:version";
  if (domain == kBrandList) return "brand:list:version";
  if (domain == kCategoryList) return "category:list:version";
  throw std::invalid_argument("unknown cache domain: " + std::string(domain));
}

void MemoryCacheInvalidator::Invalidate(std::string_view domain) {
  const auto      key = VersionKey(domain);
  std::lock_guard lock(mutex_);
  ++versions_[key];
}

int64_t MemoryCacheInvalidator::Version(std::string_view domain) {
  const auto      key = VersionKey(domain);
  std::lock_guard lock(mutex_);
  auto            it = versions_.find(key);
  return it == versions_.end() ? 0 : it->second;
}

} // namespace checkout::cache
