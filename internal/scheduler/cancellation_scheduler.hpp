#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace checkout::scheduler {

/*
  Durable delayed cancellation of unpaid checkouts.

  One job per payment, id "cancel-payment-{paymentId}", stored in the
  same database as the orders so it commits or rolls back with them.
  Scheduling the same payment again replaces the pending job.
*/
class CancellationScheduler {
 public:
  static constexpr const char* kJobType = "cancel-payment";

  static constexpr std::chrono::milliseconds kDefaultDelay{86'400'000};

  CancellationScheduler(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds delay = kDefaultDelay);

  void Schedule(db::Transaction& tx, int64_t payment_id);

  // Removes the pending job if any. Never throws; failures are logged.
  void Cancel(db::Transaction& tx, int64_t payment_id) noexcept;

  std::chrono::milliseconds delay() const {
    return delay_;
  }

  static std::string JobId(int64_t payment_id);
  static std::string EncodePayload(int64_t payment_id, std::chrono::milliseconds delay = kDefaultDelay);

  // Throws std::runtime_error on a malformed payload.
  static int64_t DecodePaymentId(const std::string& payload);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       delay_;
};

} // namespace checkout::scheduler
