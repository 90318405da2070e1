#include "internal/scheduler/delayed_job_worker.hpp"

#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace checkout::scheduler {

using observability::IntField;
using observability::StringField;

DelayedJobWorker::DelayedJobWorker(std::shared_ptr<db::Repository> repository, DelayedJobWorkerOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("delayed job worker requires a repository");
  }
  if (options_.batch_size == 0) options_.batch_size = 1;
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

DelayedJobWorker::~DelayedJobWorker() {
  Stop();
}

void DelayedJobWorker::RegisterHandler(const std::string& type, Handler handler) {
  handlers_[type] = std::move(handler);
}

void DelayedJobWorker::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&DelayedJobWorker::Run, this);
}

void DelayedJobWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void DelayedJobWorker::Run() {
  CHECKOUT_LOG_INFO("delayed job worker started", {IntField("poll_interval_ms", options_.poll_interval.count())});

  while (running_) {
    try {
      RunOnce(util::Now());
    } catch (const std::exception& e) {
      CHECKOUT_LOG_ERROR("delayed job poll failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, options_.poll_interval, [this] { return stop_requested_; })) {
      break;
    }
  }

  CHECKOUT_LOG_INFO("delayed job worker stopped");
}

std::size_t DelayedJobWorker::RunOnce(util::TimePoint now) {
  std::vector<db::model::DelayedJobRecord> due;
  {
    auto tx = repository_->Begin();
    due     = repository_->ListDueDelayedJobs(*tx, util::ToUnixMillis(now), options_.batch_size);
    tx->Commit();
  }

  std::size_t succeeded = 0;
  for (const auto& job : due) {
    Execute(job, now, succeeded);
  }
  return succeeded;
}

void DelayedJobWorker::Execute(const db::model::DelayedJobRecord& job, util::TimePoint now, std::size_t& succeeded) {
  observability::SpanScope span("delayed_job.run");
  span.SetAttribute("job.id", job.id);
  span.SetAttribute("job.type", job.type);

  auto handler = handlers_.find(job.type);
  if (handler == handlers_.end()) {
    CHECKOUT_LOG_ERROR("no handler for delayed job; dropping", {StringField("job_id", job.id), StringField("type", job.type)});
    Remove(job.id);
    return;
  }

  try {
    handler->second(job);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordJobRun(job.type, false);
    Reschedule(job, now, e.what());
    return;
  }

  observability::Metrics::Instance().RecordJobRun(job.type, true);
  Remove(job.id);
  ++succeeded;
}

void DelayedJobWorker::Reschedule(db::model::DelayedJobRecord job, util::TimePoint now, const std::string& error) {
  job.attempts++;
  if (job.attempts >= options_.max_attempts) {
    CHECKOUT_LOG_ERROR("delayed job exhausted retries; dropping",
                       {StringField("job_id", job.id), IntField("attempts", job.attempts), StringField("error", error)});
    Remove(job.id);
    return;
  }

  job.run_at_ms = util::ToUnixMillis(now + options_.retry_backoff * job.attempts);
  CHECKOUT_LOG_WARN("delayed job failed; retrying", {StringField("job_id", job.id), IntField("attempts", job.attempts),
                                                     IntField("run_at_ms", static_cast<int64_t>(job.run_at_ms)),
                                                     StringField("error", error)});

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertDelayedJob(*tx, job), "reschedule delayed job");
  tx->Commit();
}

void DelayedJobWorker::Remove(const std::string& job_id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteDelayedJob(*tx, job_id), "delete delayed job");
  tx->Commit();
}

} // namespace checkout::scheduler
