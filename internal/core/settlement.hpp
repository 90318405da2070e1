#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"

namespace checkout::ledger {
class StockLedger;
}
namespace checkout::scheduler {
class CancellationScheduler;
}
namespace checkout::cache {
class CacheInvalidator;
}

namespace checkout::core {

// Gateway transfer notification, transport independent.
struct Webhook {
  std::string                id;
  std::string                gateway;
  std::string                transaction_date;
  std::string                account_number;
  std::optional<std::string> code;
  std::optional<std::string> content;
  std::string                transfer_type;  // "in" | "out"
  int64_t                    transfer_amount = 0;
  int64_t                    accumulated     = 0;
  std::string                sub_account;
  std::string                reference_code;
  std::string                description;
};

struct SettlementResult {
  int64_t buyer_id = 0;

  // false when the payment had already left PENDING; the transaction is
  // still recorded.
  bool applied = false;
};

/*
  Payment / order status transitions.

    webhook  : PENDING -> SUCCESS,  orders PENDING_PAYMENT -> PENDING_PICKUP
    timeout  : PENDING -> FAILED,   orders PENDING_PAYMENT -> CANCELLED, stock restored
    manual   : single order PENDING_PAYMENT -> CANCELLED

  Webhook and timeout both guard on the payment still being PENDING, so
  whichever commits first wins and the other becomes a no-op.
*/
class SettlementService {
 public:
  static constexpr std::string_view kDefaultReferencePrefix = "DH";

  SettlementService(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::StockLedger> ledger,
                    std::shared_ptr<scheduler::CancellationScheduler> scheduler, std::shared_ptr<cache::CacheInvalidator> cache,
                    std::string reference_prefix = std::string(kDefaultReferencePrefix));

  SettlementResult Settle(const Webhook& webhook);

  // No-op unless the payment exists and is still PENDING. Idempotent.
  void Expire(int64_t payment_id);

  db::model::OrderRecord CancelOrder(int64_t buyer_id, int64_t order_id);

  // Digits following the first occurrence of prefix that is followed by
  // at least one digit.
  static std::optional<int64_t> ParsePaymentReference(std::string_view text, std::string_view prefix);

 private:
  int64_t ResolvePaymentId(const Webhook& webhook) const;
  void    InvalidateProductList(int64_t payment_id) noexcept;

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<ledger::StockLedger>              ledger_;
  std::shared_ptr<scheduler::CancellationScheduler> scheduler_;
  std::shared_ptr<cache::CacheInvalidator>          cache_;
  std::string                                       reference_prefix_;
};

} // namespace checkout::core
