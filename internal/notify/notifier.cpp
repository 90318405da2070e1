#include "internal/notify/notifier.hpp"

#include "internal/observability/logging.hpp"

namespace checkout::notify {

using observability::IntField;
using observability::StringField;

LogNotifier::LogNotifier() : thread_(&LogNotifier::Run, this) {
}

LogNotifier::~LogNotifier() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LogNotifier::NotifyUser(int64_t user_id, const std::string& event, const std::string& payload) noexcept {
  try {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(Event{user_id, event, payload});
    }
    cv_.notify_one();
  } catch (const std::exception& e) {
    CHECKOUT_LOG_WARN("notification dropped", {IntField("user_id", user_id), StringField("error", e.what())});
  }
}

void LogNotifier::Flush() {
  std::unique_lock lock(mutex_);
  drained_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

uint64_t LogNotifier::Delivered() {
  std::lock_guard lock(mutex_);
  return delivered_;
}

void LogNotifier::Run() {
  for (;;) {
    Event next;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) return;

      next = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    CHECKOUT_LOG_INFO("notify user", {IntField("user_id", next.user_id), StringField("event", next.event),
                                      StringField("payload", next.payload)});

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
      ++delivered_;
    }
    drained_cv_.notify_all();
  }
}

} // namespace checkout::notify
