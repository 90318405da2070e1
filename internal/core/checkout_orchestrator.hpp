#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace checkout::lock {
class LockService;
}
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

struct CheckoutGroup {
  int64_t                   shop_id = 0;
  db::model::ReceiverRecord receiver;
  std::vector<int64_t>      cart_item_ids;
};

struct CheckoutResult {
  int64_t                            payment_id = 0;
  std::vector<db::model::OrderRecord> orders;
};

struct OrderQuery {
  uint32_t                                    page  = 1;
  uint32_t                                    limit = 10;
  std::optional<checkout::model::OrderStatus> status;
};

struct OrderPage {
  std::vector<db::model::OrderRecord> orders;
  uint32_t                            page        = 1;
  uint32_t                            limit       = 10;
  uint64_t                            total_items = 0;
  uint64_t                            total_pages = 0;
};

/*
  CheckoutOrchestrator

  Turns a buyer's cart items (grouped by seller) into one Payment and one
  Order per group.

    1. short read transaction: resolve cart items -> distinct SKU ids
    2. lease every SKU key in one batch (fail fast)
    3. one transaction: validate, create payment/orders/snapshots, delete
       consumed cart items, guarded stock decrement, schedule the
       cancellation job
    4. release leases
    5. invalidate the product-list cache (logged, never fails the call)

  Nothing is retried here; contention surfaces to the caller.
*/
class CheckoutOrchestrator {
 public:
  static constexpr std::chrono::milliseconds kDefaultLockTtl{3000};

  CheckoutOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks,
                       std::shared_ptr<ledger::StockLedger> ledger, std::shared_ptr<scheduler::CancellationScheduler> scheduler,
                       std::shared_ptr<cache::CacheInvalidator> cache, std::chrono::milliseconds lock_ttl = kDefaultLockTtl);

  CheckoutResult Checkout(int64_t buyer_id, const std::vector<CheckoutGroup>& groups);

  db::model::OrderRecord GetOrder(int64_t buyer_id, int64_t order_id);

  OrderPage ListOrders(int64_t buyer_id, const OrderQuery& query);

 private:
  CheckoutResult CommitCheckout(int64_t buyer_id, const std::vector<CheckoutGroup>& groups, const std::vector<int64_t>& cart_item_ids);

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<lock::LockService>                locks_;
  std::shared_ptr<ledger::StockLedger>              ledger_;
  std::shared_ptr<scheduler::CancellationScheduler> scheduler_;
  std::shared_ptr<cache::CacheInvalidator>          cache_;
  std::chrono::milliseconds                         lock_ttl_;
};

} // namespace checkout::core
