#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace checkout::scheduler {

struct DelayedJobWorkerOptions {
  std::chrono::milliseconds poll_interval{1000};
  std::size_t               batch_size   = 32;
  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds retry_backoff{30'000};
};

/*
  Background worker that fires due delayed jobs.

  Each poll reads up to batch_size jobs with run_at <= now and hands each
  to the handler registered for its type, outside any transaction.

    success  -> job deleted
    failure  -> attempts+1, run_at = now + backoff * attempts
    attempts reaches max_attempts -> job dropped, error logged

  Delivery is at-least-once; handlers must be idempotent.
*/
class DelayedJobWorker {
 public:
  using Handler = std::function<void(const db::model::DelayedJobRecord&)>;

  DelayedJobWorker(std::shared_ptr<db::Repository> repository, DelayedJobWorkerOptions options = {});
  ~DelayedJobWorker();

  // Register before Start().
  void RegisterHandler(const std::string& type, Handler handler);

  void Start();
  void Stop();

  // One poll; returns the number of jobs that ran successfully.
  std::size_t RunOnce(util::TimePoint now);

 private:
  void Run();
  void Execute(const db::model::DelayedJobRecord& job, util::TimePoint now, std::size_t& succeeded);
  void Reschedule(db::model::DelayedJobRecord job, util::TimePoint now, const std::string& error);
  void Remove(const std::string& job_id);

  std::shared_ptr<db::Repository>          repository_;
  DelayedJobWorkerOptions                  options_;
  std::unordered_map<std::string, Handler> handlers_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace checkout::scheduler
