#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/lock/lock_service.hpp"

namespace checkout::lock {

/*
  In-process lease table for single-node deployments and tests.

  key -> {token, expiry}; an expired entry counts as free and is
  overwritten by the next Acquire.
*/
class MemoryLockService final : public LockService {
 public:
  LockLease Acquire(const std::vector<std::string>& keys, std::chrono::milliseconds ttl) override;

  void Release(const LockLease& lease) noexcept override;

  // Live (unexpired) keys; for tests and diagnostics.
  std::size_t ActiveCount();

 private:
  using Clock = std::chrono::system_clock;

  struct Entry {
    std::string       token;
    Clock::time_point expires_at;
  };

  static bool IsExpired(const Entry& entry, Clock::time_point now);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace checkout::lock
