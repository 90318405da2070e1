#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace checkout::db::memory {

using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

bool Matches(const model::OrderRecord& o, const model::OrderFilter& f) {
  if (o.user_id != f.user_id || o.deleted_at_ms) return false;
  return !f.status || o.status == *f.status;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, model::ProductRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) r.id = s.next_product_id;
  if (s.products.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.next_product_id = std::max(s.next_product_id, r.id + 1);

  for (auto& tr : r.translations) {
    if (tr.id == 0) tr.id = s.next_translation_id++;
  }
  s.products[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertSku(Transaction& t, model::SkuRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.products.contains(r.product_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown product");
  if (r.stock < 0) return Result::Err(ErrorCode::ConstraintViolation, "negative stock");
  if (r.id == 0) r.id = s.next_sku_id;
  if (s.skus.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.next_sku_id = std::max(s.next_sku_id, r.id + 1);
  s.skus[r.id]  = r;
  return Result::Ok();
}

std::optional<model::SkuRecord> MemoryRepository::GetSku(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.skus.find(id);
  if (it == s.skus.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSku(Transaction& t, const model::SkuRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.skus.find(r.id);
  if (it == s.skus.end()) return Result::Err(ErrorCode::NotFound);
  if (r.stock < 0) return Result::Err(ErrorCode::ConstraintViolation, "negative stock");

  const auto version = it->second.version;
  it->second         = r;
  it->second.version = version + 1;
  return Result::Ok();
}

Result MemoryRepository::DeleteSku(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.skus.erase(id)) return Result::Err(ErrorCode::NotFound);

  for (auto it = s.cart_items.begin(); it != s.cart_items.end();) {
    if (it->second.sku_id == id)
      it = s.cart_items.erase(it);
    else
      ++it;
  }
  for (auto& [_, order] : s.orders) {
    for (auto& item : order.items) {
      if (item.sku_id == id) item.sku_id.reset();
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cart
// ------------------------------------------------------------------

Result MemoryRepository::InsertCartItem(Transaction& t, model::CartItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.skus.contains(r.sku_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown sku");
  if (r.quantity < 1) return Result::Err(ErrorCode::ConstraintViolation, "quantity must be positive");
  if (r.id == 0) r.id = s.next_cart_item_id;
  if (s.cart_items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.next_cart_item_id = std::max(s.next_cart_item_id, r.id + 1);
  s.cart_items[r.id]  = r;
  return Result::Ok();
}

std::vector<model::CartLine> MemoryRepository::GetCartLines(Transaction& t, int64_t user_id, const std::vector<int64_t>& ids) {
  const auto&                 s = TX(t).View();
  std::unordered_set<int64_t> wanted(ids.begin(), ids.end());

  std::vector<model::CartLine> lines;
  for (const auto& [id, item] : s.cart_items) {
    if (!wanted.contains(id) || item.user_id != user_id) continue;

    auto sku = s.skus.find(item.sku_id);
    if (sku == s.skus.end()) continue;
    auto product = s.products.find(sku->second.product_id);
    if (product == s.products.end()) continue;

    lines.push_back(model::CartLine{item, sku->second, product->second});
  }
  return lines;
}

Result MemoryRepository::DeleteCartItems(Transaction& t, const std::vector<int64_t>& ids) {
  auto& s = TX(t).Mutable();
  for (auto id : ids) s.cart_items.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Stock
// ------------------------------------------------------------------

Result MemoryRepository::DecrementStock(Transaction& t, int64_t sku_id, int64_t quantity, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.skus.find(sku_id);
  if (it == s.skus.end() || it->second.version != expected_version || it->second.stock < quantity) {
    return Result::Err(ErrorCode::Conflict, "stock guard failed for sku " + std::to_string(sku_id));
  }
  it->second.stock -= quantity;
  it->second.version++;
  return Result::Ok();
}

Result MemoryRepository::IncrementStock(Transaction& t, int64_t sku_id, int64_t quantity) {
  auto& s  = TX(t).Mutable();
  auto  it = s.skus.find(sku_id);
  if (it == s.skus.end()) return Result::Err(ErrorCode::NotFound);
  it->second.stock += quantity;
  it->second.version++;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_payment_id++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms  = r.created_at_ms;
  s.payments[r.id] = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.payments.find(id);
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePaymentStatus(Transaction& t, int64_t id, PaymentStatus from, PaymentStatus to) {
  auto& s  = TX(t).Mutable();
  auto  it = s.payments.find(id);
  if (it == s.payments.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != from) return Result::Err(ErrorCode::Conflict, "payment status changed");
  it->second.status        = to;
  it->second.updated_at_ms = NowMs();
  return Result::Ok();
}

Result MemoryRepository::InsertPaymentTransaction(Transaction& t, const model::PaymentTransactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.payment_transactions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  auto& stored = s.payment_transactions[r.id];
  stored       = r;
  if (stored.created_at_ms == 0) stored.created_at_ms = NowMs();
  return Result::Ok();
}

std::optional<model::PaymentTransactionRecord> MemoryRepository::GetPaymentTransaction(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.payment_transactions.find(id);
  if (it == s.payment_transactions.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrder(Transaction& t, model::OrderRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.payments.contains(r.payment_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown payment");

  const auto now = NowMs();
  r.id           = s.next_order_id++;
  if (r.created_at_ms == 0) r.created_at_ms = now;
  r.updated_at_ms = r.created_at_ms;

  for (auto& item : r.items) {
    item.id       = s.next_order_item_id++;
    item.order_id = r.id;
    if (item.created_at_ms == 0) item.created_at_ms = r.created_at_ms;
  }
  s.orders[r.id] = r;
  return Result::Ok();
}

std::optional<model::OrderRecord> MemoryRepository::GetOrder(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.orders.find(id);
  if (it == s.orders.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OrderRecord> MemoryRepository::ListOrdersByPayment(Transaction& t, int64_t payment_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::OrderRecord> out;
  for (const auto& [_, order] : s.orders) {
    if (order.payment_id == payment_id) out.push_back(order);
  }
  return out;
}

std::vector<model::OrderRecord> MemoryRepository::ListOrders(Transaction& t, const model::OrderFilter& f) {
  const auto&                     s = TX(t).View();
  std::vector<model::OrderRecord> matched;
  for (const auto& [_, order] : s.orders) {
    if (Matches(order, f)) matched.push_back(order);
  }

  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });

  if (f.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(f.offset);
  auto last  = matched.end();
  if (matched.size() - f.offset > f.limit) last = first + static_cast<std::ptrdiff_t>(f.limit);
  return {first, last};
}

uint64_t MemoryRepository::CountOrders(Transaction& t, const model::OrderFilter& f) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.orders.begin(), s.orders.end(), [&](const auto& kv) { return Matches(kv.second, f); }));
}

Result MemoryRepository::UpdateOrderStatus(Transaction& t, int64_t id, OrderStatus from, OrderStatus to,
                                           std::optional<int64_t> updated_by) {
  auto& s  = TX(t).Mutable();
  auto  it = s.orders.find(id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != from) return Result::Err(ErrorCode::Conflict, "order status changed");

  it->second.status        = to;
  it->second.updated_at_ms = NowMs();
  if (updated_by) it->second.updated_by = updated_by;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Delayed jobs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDelayedJob(Transaction& t, const model::DelayedJobRecord& r) {
  auto& stored = TX(t).Mutable().delayed_jobs[r.id];
  stored       = r;
  if (stored.created_at_ms == 0) stored.created_at_ms = NowMs();
  return Result::Ok();
}

Result MemoryRepository::DeleteDelayedJob(Transaction& t, const std::string& id) {
  TX(t).Mutable().delayed_jobs.erase(id);
  return Result::Ok();
}

std::optional<model::DelayedJobRecord> MemoryRepository::GetDelayedJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.delayed_jobs.find(id);
  if (it == s.delayed_jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DelayedJobRecord> MemoryRepository::ListDueDelayedJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  const auto&                          s = TX(t).View();
  std::vector<model::DelayedJobRecord> due;
  for (const auto& [_, job] : s.delayed_jobs) {
    if (job.run_at_ms <= now_ms) due.push_back(job);
  }
  std::sort(due.begin(), due.end(), [](const auto& a, const auto& b) {
    if (a.run_at_ms != b.run_at_ms) return a.run_at_ms < b.run_at_ms;
    return a.id < b.id;
  });
  if (due.size() > limit) due.resize(limit);
  return due;
}

} // namespace checkout::db::memory
