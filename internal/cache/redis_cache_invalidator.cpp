#include "internal/cache/redis_cache_invalidator.hpp"

#include <stdexcept>

namespace checkout::cache {

RedisCacheInvalidator::RedisCacheInvalidator(std::shared_ptr<sw::redis::Redis> redis) : redis_(std::move(redis)) {
  if (!redis_) {
    throw std::invalid_argument("redis cache invalidator requires a client");
  }
}

void RedisCacheInvalidator::Invalidate(std::string_view domain) {
  redis_->incr(VersionKey(domain));
}

} // namespace checkout::cache
