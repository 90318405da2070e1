#pragma once

#include <sw/redis++/redis++.h>

#include <memory>
#include <string>

#include "internal/lock/lock_service.hpp"

namespace checkout::lock {

/*
  Redis-backed lock manager.

  Acquire runs one Lua script: if none of KEYS exist, SET each to the
  token with PX ttl and return 1, else return 0. Release runs a Lua
  compare-and-delete per key.
*/
class RedisLockService final : public LockService {
 public:
  explicit RedisLockService(std::shared_ptr<sw::redis::Redis> redis);

  LockLease Acquire(const std::vector<std::string>& keys, std::chrono::milliseconds ttl) override;

  void Release(const LockLease& lease) noexcept override;

 private:
  std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace checkout::lock
