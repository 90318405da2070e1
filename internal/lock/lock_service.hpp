#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace checkout::lock {

/*
  Lease over a set of keys in the coordination store.

  token identifies the holder; release only removes keys whose stored
  token still equals it, so an expired lease can never delete a newer
  holder's key.
*/
struct LockLease {
  std::string                           token;
  std::vector<std::string>              keys;
  std::chrono::system_clock::time_point expires_at;
};

/*
  Distributed lock manager.

  Acquire is all-or-nothing and fails fast: if any key is held the call
  throws LockUnavailable and nothing stays held. Release is best effort
  and never throws.
*/
class LockService {
 public:
  virtual ~LockService() = default;

  virtual LockLease Acquire(const std::vector<std::string>& keys, std::chrono::milliseconds ttl) = 0;

  virtual void Release(const LockLease& lease) noexcept = 0;
};

// "lock:sku:{id}" for every distinct id, sorted.
std::vector<std::string> SkuLockKeys(const std::vector<int64_t>& sku_ids);

/*
  Releases the lease on scope exit.
*/
class ScopedLease {
 public:
  ScopedLease(LockService& service, LockLease lease) : service_(service), lease_(std::move(lease)) {
  }
  ~ScopedLease() {
    service_.Release(lease_);
  }

  ScopedLease(const ScopedLease&)            = delete;
  ScopedLease& operator=(const ScopedLease&) = delete;

  const LockLease& lease() const {
    return lease_;
  }

 private:
  LockService& service_;
  LockLease    lease_;
};

} // namespace checkout::lock
