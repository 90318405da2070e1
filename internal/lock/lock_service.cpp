#include "internal/lock/lock_service.hpp"

#include <algorithm>

namespace checkout::lock {

std::vector<std::string> SkuLockKeys(const std::vector<int64_t>& sku_ids) {
  std::vector<int64_t> ids = sku_ids;
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  std::vector<std::string> keys;
  keys.reserve(ids.size());
  for (auto id : ids) {
    keys.push_back("lock:sku:" + std::to_string(id));
  }
  return keys;
}

} // namespace checkout::lock
