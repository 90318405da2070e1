#include "internal/core/checkout_orchestrator.hpp"

#include <map>
#include <stdexcept>
#include <unordered_map>

#include "internal/cache/cache_invalidator.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/cancellation_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace checkout::core {

using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kMaxPageSize = 100;

struct SkuDemand {
  int64_t  quantity = 0;
  uint64_t version  = 0;
  int64_t  stock    = 0;
};

bool IsPurchasable(const db::model::ProductRecord& product, uint64_t now_ms) {
  return !product.deleted_at_ms && product.published_at_ms && *product.published_at_ms <= now_ms;
}

db::model::OrderItemRecord Snapshot(const db::model::CartLine& line) {
  db::model::OrderItemRecord item;
  item.sku_id                = line.sku.id;
  item.product_id            = line.product.id;
  item.snapshot.product_name = line.product.name;
  item.snapshot.sku_price    = line.sku.price;
  item.snapshot.image        = line.sku.image;
  item.snapshot.sku_value    = line.sku.value;
  item.snapshot.quantity     = line.item.quantity;
  item.snapshot.translations = line.product.translations;
  return item;
}

} // namespace

CheckoutOrchestrator::CheckoutOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks,
                                           std::shared_ptr<ledger::StockLedger>              ledger,
                                           std::shared_ptr<scheduler::CancellationScheduler> scheduler,
                                           std::shared_ptr<cache::CacheInvalidator> cache, std::chrono::milliseconds lock_ttl)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      ledger_(std::move(ledger)),
      scheduler_(std::move(scheduler)),
      cache_(std::move(cache)),
      lock_ttl_(lock_ttl.count() > 0 ? lock_ttl : kDefaultLockTtl) {
  if (!repository_ || !locks_ || !ledger_ || !scheduler_ || !cache_) {
    throw std::invalid_argument("checkout orchestrator: missing dependency");
  }
}

CheckoutResult CheckoutOrchestrator::Checkout(int64_t buyer_id, const std::vector<CheckoutGroup>& groups) {
  observability::SpanScope span("checkout.Checkout");
  span.SetAttribute("buyer_id", buyer_id);

  if (groups.empty()) {
    throw util::InvalidArgument("checkout requires at least one seller group");
  }

  std::vector<int64_t> cart_item_ids;
  for (const auto& group : groups) {
    if (group.cart_item_ids.empty()) {
      throw util::InvalidArgument("seller group " + std::to_string(group.shop_id) + " has no cart items");
    }
    cart_item_ids.insert(cart_item_ids.end(), group.cart_item_ids.begin(), group.cart_item_ids.end());
  }

  // Resolve which SKUs to lease. Released before locking: a transaction
  // must never wait on a lease.
  std::vector<int64_t> sku_ids;
  {
    auto tx = repository_->Begin();
    for (const auto& line : repository_->GetCartLines(*tx, buyer_id, cart_item_ids)) {
      sku_ids.push_back(line.sku.id);
    }
    tx->Commit();
  }

  CheckoutResult result;
  try {
    lock::ScopedLease lease(*locks_, locks_->Acquire(lock::SkuLockKeys(sku_ids), lock_ttl_));
    result = CommitCheckout(buyer_id, groups, cart_item_ids);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordCheckout("rejected");
    CHECKOUT_LOG_WARN("checkout rejected", {IntField("buyer_id", buyer_id), StringField("error", e.what())});
    throw;
  }

  observability::Metrics::Instance().RecordCheckout("committed");
  CHECKOUT_LOG_INFO("checkout committed", {IntField("buyer_id", buyer_id), IntField("payment_id", result.payment_id),
                                           IntField("orders", static_cast<int64_t>(result.orders.size()))});

  try {
    cache_->Invalidate(cache::kProductList);
  } catch (const std::exception& e) {
    CHECKOUT_LOG_WARN("product-list invalidation failed", {IntField("payment_id", result.payment_id), StringField("error", e.what())});
  }
  return result;
}

CheckoutResult CheckoutOrchestrator::CommitCheckout(int64_t buyer_id, const std::vector<CheckoutGroup>& groups,
                                                    const std::vector<int64_t>& cart_item_ids) {
  auto tx = repository_->Begin();

  const auto lines = repository_->GetCartLines(*tx, buyer_id, cart_item_ids);
  if (lines.size() != cart_item_ids.size()) {
    throw util::CartItemNotFound("requested " + std::to_string(cart_item_ids.size()) + " cart items, found " +
                                 std::to_string(lines.size()));
  }

  std::unordered_map<int64_t, const db::model::CartLine*> by_cart_id;
  std::map<int64_t, SkuDemand>                            demand;
  for (const auto& line : lines) {
    by_cart_id[line.item.id] = &line;

    auto& d = demand[line.sku.id];
    d.quantity += line.item.quantity;
    d.version = line.sku.version;
    d.stock   = line.sku.stock;
  }

  for (const auto& [sku_id, d] : demand) {
    if (d.quantity > d.stock) {
      throw util::OutOfStock("sku " + std::to_string(sku_id) + " has " + std::to_string(d.stock) + " left, " +
                             std::to_string(d.quantity) + " requested");
    }
  }

  const auto now_ms = util::ToUnixMillis(util::Now());
  for (const auto& line : lines) {
    if (!IsPurchasable(line.product, now_ms)) {
      throw util::ProductUnavailable("product " + std::to_string(line.product.id) + " is not available");
    }
  }

  for (const auto& group : groups) {
    for (auto cart_item_id : group.cart_item_ids) {
      const auto* line = by_cart_id.at(cart_item_id);
      if (line->sku.created_by != group.shop_id) {
        throw util::SellerMismatch("sku " + std::to_string(line->sku.id) + " does not belong to shop " +
                                   std::to_string(group.shop_id));
      }
    }
  }

  db::model::PaymentRecord payment;
  payment.status = PaymentStatus::kPending;
  db::ThrowIfDbError(repository_->InsertPayment(*tx, payment), "insert payment");

  CheckoutResult result;
  result.payment_id = payment.id;
  for (const auto& group : groups) {
    db::model::OrderRecord order;
    order.user_id    = buyer_id;
    order.shop_id    = group.shop_id;
    order.payment_id = payment.id;
    order.status     = OrderStatus::kPendingPayment;
    order.receiver   = group.receiver;
    order.created_by = buyer_id;
    for (auto cart_item_id : group.cart_item_ids) {
      order.items.push_back(Snapshot(*by_cart_id.at(cart_item_id)));
    }
    db::ThrowIfDbError(repository_->InsertOrder(*tx, order), "insert order");
    result.orders.push_back(std::move(order));
  }

  db::ThrowIfDbError(repository_->DeleteCartItems(*tx, cart_item_ids), "delete cart items");

  for (const auto& [sku_id, d] : demand) {
    ledger_->Decrement(*tx, sku_id, d.quantity, d.version);
  }

  scheduler_->Schedule(*tx, payment.id);

  tx->Commit();
  return result;
}

db::model::OrderRecord CheckoutOrchestrator::GetOrder(int64_t buyer_id, int64_t order_id) {
  auto tx    = repository_->Begin();
  auto order = repository_->GetOrder(*tx, order_id);
  tx->Commit();

  if (!order || order->user_id != buyer_id || order->deleted_at_ms) {
    throw util::OrderNotFound("order " + std::to_string(order_id) + " not found");
  }
  return *order;
}

OrderPage CheckoutOrchestrator::ListOrders(int64_t buyer_id, const OrderQuery& query) {
  OrderPage page;
  page.page  = query.page == 0 ? 1 : query.page;
  page.limit = query.limit == 0 ? 10 : query.limit;
  if (page.limit > kMaxPageSize) {
    throw util::InvalidArgument("limit must not exceed " + std::to_string(kMaxPageSize));
  }

  db::model::OrderFilter filter;
  filter.user_id = buyer_id;
  filter.status  = query.status;
  filter.limit   = page.limit;
  filter.offset  = static_cast<std::size_t>(page.page - 1) * page.limit;

  auto tx          = repository_->Begin();
  page.orders      = repository_->ListOrders(*tx, filter);
  page.total_items = repository_->CountOrders(*tx, filter);
  tx->Commit();

  page.total_pages = (page.total_items + page.limit - 1) / page.limit;
  return page;
}

} // namespace checkout::core
