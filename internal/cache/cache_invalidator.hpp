#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace checkout::cache {

/*
  Read-side list caches key their entries with a per-domain version
  counter; bumping the counter orphans every cached page of that domain.

    product-list  -> product:list:version
    brand-list    -> brand:list:version
    category-list -> category:list:version
*/
inline constexpr std::string_view kProductList  = "product-list";
inline constexpr std::string_view kBrandList    = "brand-list";
inline constexpr std::string_view kCategoryList = "category-list";

// Throws std::invalid_argument for an unknown domain.
std::string VersionKey(std::string_view domain);

class CacheInvalidator {
 public:
  virtual ~CacheInvalidator() = default;

  virtual void Invalidate(std::string_view domain) = 0;
};

class MemoryCacheInvalidator final : public CacheInvalidator {
 public:
  void Invalidate(std::string_view domain) override;

  // 0 until the first invalidation.
  int64_t Version(std::string_view domain);

 private:
  std::mutex                               mutex_;
  std::unordered_map<std::string, int64_t> versions_;
};

} // namespace checkout::cache
