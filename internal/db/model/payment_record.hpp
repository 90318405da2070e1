#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace checkout::db::model {

struct PaymentRecord {
  int64_t                        id     = 0;
  checkout::model::PaymentStatus status = checkout::model::PaymentStatus::kUnspecified;
  uint64_t                       created_at_ms = 0;
  uint64_t                       updated_at_ms = 0;
};

/*
  Gateway transfer as received by the webhook.

  Write-once. The gateway id is the primary key, so a replayed webhook
  collides instead of overwriting.
*/
struct PaymentTransactionRecord {
  std::string                id;
  std::string                gateway;
  std::string                transaction_date;
  std::string                account_number;
  std::optional<std::string> code;
  std::optional<std::string> content;
  int64_t                    amount_in   = 0;
  int64_t                    amount_out  = 0;
  int64_t                    accumulated = 0;
  std::string                sub_account;
  std::string                reference_code;
  std::string                description;
  uint64_t                   created_at_ms = 0;
};

} // namespace checkout::db::model
