#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace checkout::notify {

/*
  Outbound user notification ("payment settled for user X").
  Delivery is asynchronous and best effort; NotifyUser never throws.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void NotifyUser(int64_t user_id, const std::string& event, const std::string& payload) noexcept = 0;
};

/*
  Queues events and writes them to the log from a background thread.
  Stands in for the real-time gateway in single-node deployments.
*/
class LogNotifier final : public Notifier {
 public:
  LogNotifier();
  ~LogNotifier();

  LogNotifier(const LogNotifier&)            = delete;
  LogNotifier& operator=(const LogNotifier&) = delete;

  void NotifyUser(int64_t user_id, const std::string& event, const std::string& payload) noexcept override;

  // Blocks until everything queued so far has been delivered.
  void Flush();

  uint64_t Delivered();

 private:
  struct Event {
    int64_t     user_id = 0;
    std::string event;
    std::string payload;
  };

  void Run();

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_cv_;
  std::deque<Event>       queue_;
  bool                    shutdown_  = false;
  bool                    busy_      = false;
  uint64_t                delivered_ = 0;
  std::thread             thread_;
};

} // namespace checkout::notify
