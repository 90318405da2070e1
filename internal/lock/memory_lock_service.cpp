#include "internal/lock/memory_lock_service.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/token.hpp"

namespace checkout::lock {

bool MemoryLockService::IsExpired(const Entry& entry, Clock::time_point now) {
  return entry.expires_at <= now;
}

LockLease MemoryLockService::Acquire(const std::vector<std::string>& keys, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = Clock::now();
  for (const auto& key : keys) {
    auto it = entries_.find(key);
    if (it != entries_.end() && !IsExpired(it->second, now)) {
      throw util::LockUnavailable("lock held: " + key);
    }
  }

  LockLease lease{util::GenerateToken(), keys, now + ttl};
  for (const auto& key : keys) {
    entries_[key] = Entry{lease.token, lease.expires_at};
  }
  return lease;
}

void MemoryLockService::Release(const LockLease& lease) noexcept {
  std::lock_guard lock(mutex_);

  for (const auto& key : lease.keys) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.token == lease.token) {
      entries_.erase(it);
    }
  }
}

std::size_t MemoryLockService::ActiveCount() {
  std::lock_guard lock(mutex_);

  const auto now = Clock::now();
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now))
      it = entries_.erase(it);
    else
      ++it;
  }
  return entries_.size();
}

} // namespace checkout::lock
