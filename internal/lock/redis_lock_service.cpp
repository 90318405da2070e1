#include "internal/lock/redis_lock_service.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/token.hpp"

namespace checkout::lock {

namespace {

constexpr const char* kAcquireScript = R"lua(
for i = 1, #KEYS do
  if redis.call('EXISTS', KEYS[i]) == 1 then
    return 0
  end
end
for i = 1, #KEYS do
  redis.call('SET', KEYS[i], ARGV[1], 'PX', ARGV[2])
end
return 1
)lua";

constexpr const char* kReleaseScript = R"lua(
local released = 0
for i = 1, #KEYS do
  if redis.call('GET', KEYS[i]) == ARGV[1] then
    released = released + redis.call('DEL', KEYS[i])
  end
end
return released
)lua";

} // namespace

RedisLockService::RedisLockService(std::shared_ptr<sw::redis::Redis> redis) : redis_(std::move(redis)) {
  if (!redis_) {
    throw std::invalid_argument("redis lock service requires a client");
  }
}

LockLease RedisLockService::Acquire(const std::vector<std::string>& keys, std::chrono::milliseconds ttl) {
  LockLease lease{util::GenerateToken(), keys, std::chrono::system_clock::now() + ttl};
  if (keys.empty()) return lease;

  const std::vector<std::string> args{lease.token, std::to_string(ttl.count())};
  long long acquired = 0;
  try {
    acquired = redis_->eval<long long>(kAcquireScript, keys.begin(), keys.end(), args.begin(), args.end());
  } catch (const sw::redis::Error& e) {
    throw util::LockUnavailable(std::string("lock store error: ") + e.what());
  }

  if (acquired != 1) {
    throw util::LockUnavailable("lock held on one of " + std::to_string(keys.size()) + " keys");
  }
  return lease;
}

void RedisLockService::Release(const LockLease& lease) noexcept {
  if (lease.keys.empty()) return;

  try {
    const std::vector<std::string> args{lease.token};
    redis_->eval<long long>(kReleaseScript, lease.keys.begin(), lease.keys.end(), args.begin(), args.end());
  } catch (const std::exception& e) {
    CHECKOUT_LOG_WARN("lock release failed", {observability::StringField("token", lease.token),
                                              observability::StringField("error", e.what())});
  }
}

} // namespace checkout::lock
