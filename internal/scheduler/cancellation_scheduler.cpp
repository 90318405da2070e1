#include "internal/scheduler/cancellation_scheduler.hpp"

#include <google/protobuf/util/json_util.h>

#include <limits>
#include <stdexcept>

#include "checkout/manager/v1/types.pb.h"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace checkout::scheduler {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int64_t kMaxPayloadValue = std::numeric_limits<int32_t>::max();

} // namespace

CancellationScheduler::CancellationScheduler(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds delay)
    : repository_(std::move(repository)), delay_(delay.count() > 0 ? delay : kDefaultDelay) {
  if (!repository_) {
    throw std::invalid_argument("cancellation scheduler requires a repository");
  }
  if (delay_.count() > kMaxPayloadValue) {
    throw std::invalid_argument("cancellation delay exceeds " + std::to_string(kMaxPayloadValue) + " ms");
  }
}

std::string CancellationScheduler::JobId(int64_t payment_id) {
  return "cancel-payment-" + std::to_string(payment_id);
}

std::string CancellationScheduler::EncodePayload(int64_t payment_id, std::chrono::milliseconds delay) {
  if (payment_id <= 0 || payment_id > kMaxPayloadValue) {
    throw std::out_of_range("payment id " + std::to_string(payment_id) + " does not fit a cancel job payload");
  }
  if (delay.count() < 0 || delay.count() > kMaxPayloadValue) {
    throw std::out_of_range("cancel job delay " + std::to_string(delay.count()) + " ms out of range");
  }

  checkout::manager::v1::CancelPaymentJob job;
  job.set_job_id(JobId(payment_id));
  job.set_delay_ms(static_cast<int32_t>(delay.count()));
  job.mutable_data()->set_payment_id(static_cast<int32_t>(payment_id));

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(job, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode cancel job: " + std::string(status.message()));
  }
  return json;
}

int64_t CancellationScheduler::DecodePaymentId(const std::string& payload) {
  checkout::manager::v1::CancelPaymentJob job;
  const auto status = google::protobuf::util::JsonStringToMessage(payload, &job);
  if (!status.ok()) {
    throw std::runtime_error("malformed cancel job payload: " + std::string(status.message()));
  }
  if (job.data().payment_id() <= 0) {
    throw std::runtime_error("cancel job payload has no payment id");
  }
  return job.data().payment_id();
}

void CancellationScheduler::Schedule(db::Transaction& tx, int64_t payment_id) {
  const auto now = util::Now();

  db::model::DelayedJobRecord job;
  job.id            = JobId(payment_id);
  job.type          = kJobType;
  job.payload       = EncodePayload(payment_id, delay_);
  job.run_at_ms     = util::ToUnixMillis(now + delay_);
  job.attempts      = 0;
  job.created_at_ms = util::ToUnixMillis(now);

  db::ThrowIfDbError(repository_->UpsertDelayedJob(tx, job), "schedule cancellation");
}

void CancellationScheduler::Cancel(db::Transaction& tx, int64_t payment_id) noexcept {
  try {
    const auto result = repository_->DeleteDelayedJob(tx, JobId(payment_id));
    if (!result) {
      CHECKOUT_LOG_WARN("cancel scheduled job failed", {IntField("payment_id", payment_id), StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    CHECKOUT_LOG_WARN("cancel scheduled job failed", {IntField("payment_id", payment_id), StringField("error", e.what())});
  }
}

} // namespace checkout::scheduler
