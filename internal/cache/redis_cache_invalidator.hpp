#pragma once

#include <sw/redis++/redis++.h>

#include <memory>

#include "internal/cache/cache_invalidator.hpp"

namespace checkout::cache {

// INCR on the domain's version key in the shared cache store.
class RedisCacheInvalidator final : public CacheInvalidator {
 public:
  explicit RedisCacheInvalidator(std::shared_ptr<sw::redis::Redis> redis);

  void Invalidate(std::string_view domain) override;

 private:
  std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace checkout::cache
