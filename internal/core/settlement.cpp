#include "internal/core/settlement.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

#include "internal/cache/cache_invalidator.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/cancellation_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace checkout::core {

using checkout::model::CanTransition;
using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

int64_t ExpectedTotal(const std::vector<db::model::OrderRecord>& orders) {
  int64_t total = 0;
  for (const auto& order : orders) {
    for (const auto& item : order.items) {
      total += item.snapshot.sku_price * item.snapshot.quantity;
    }
  }
  return total;
}

} // namespace

SettlementService::SettlementService(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::StockLedger> ledger,
                                     std::shared_ptr<scheduler::CancellationScheduler> scheduler,
                                     std::shared_ptr<cache::CacheInvalidator> cache, std::string reference_prefix)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      scheduler_(std::move(scheduler)),
      cache_(std::move(cache)),
      reference_prefix_(reference_prefix.empty() ? std::string(kDefaultReferencePrefix) : std::move(reference_prefix)) {
  if (!repository_ || !ledger_ || !scheduler_ || !cache_) {
    throw std::invalid_argument("settlement service: missing dependency");
  }
}

std::optional<int64_t> SettlementService::ParsePaymentReference(std::string_view text, std::string_view prefix) {
  if (prefix.empty()) {
    return std::nullopt;
  }

  for (auto pos = text.find(prefix); pos != std::string_view::npos; pos = text.find(prefix, pos + 1)) {
    auto    cursor = pos + prefix.size();
    int64_t value  = 0;
    bool    digits = false;
    while (cursor < text.size() && std::isdigit(static_cast<unsigned char>(text[cursor]))) {
      const int64_t d = text[cursor] - '0';
      if (value > (std::numeric_limits<int64_t>::max() - d) / 10) {
        return std::nullopt;
      }
      value  = value * 10 + d;
      digits = true;
      ++cursor;
    }
    if (digits) {
      return value;
    }
  }
  return std::nullopt;
}

int64_t SettlementService::ResolvePaymentId(const Webhook& webhook) const {
  std::optional<int64_t> id;
  if (webhook.code && !webhook.code->empty()) {
    id = ParsePaymentReference(*webhook.code, reference_prefix_);
  } else if (webhook.content) {
    id = ParsePaymentReference(*webhook.content, reference_prefix_);
  }
  if (!id) {
    throw util::InvalidPaymentReference("no payment reference with prefix " + reference_prefix_ + " in transaction " + webhook.id);
  }
  return *id;
}

SettlementResult SettlementService::Settle(const Webhook& webhook) {
  observability::SpanScope span("payment.Settle");
  span.SetAttribute("transaction_id", webhook.id);

  if (webhook.id.empty()) {
    throw util::InvalidArgument("webhook transaction id is required");
  }
  if (webhook.transfer_type != "in" && webhook.transfer_type != "out") {
    throw util::InvalidArgument("transfer_type must be \"in\" or \"out\"");
  }

  auto tx = repository_->Begin();

  if (repository_->GetPaymentTransaction(*tx, webhook.id)) {
    throw util::DuplicateTransaction("transaction " + webhook.id + " already recorded");
  }

  const auto payment_id = ResolvePaymentId(webhook);
  span.SetAttribute("payment_id", payment_id);

  db::model::PaymentTransactionRecord record;
  record.id               = webhook.id;
  record.gateway          = webhook.gateway;
  record.transaction_date = webhook.transaction_date;
  record.account_number   = webhook.account_number;
  record.code             = webhook.code;
  record.content          = webhook.content;
  record.amount_in        = webhook.transfer_type == "in" ? webhook.transfer_amount : 0;
  record.amount_out       = webhook.transfer_type == "out" ? webhook.transfer_amount : 0;
  record.accumulated      = webhook.accumulated;
  record.sub_account      = webhook.sub_account;
  record.reference_code   = webhook.reference_code;
  record.description      = webhook.description;
  record.created_at_ms    = util::ToUnixMillis(util::Now());

  const auto inserted = repository_->InsertPaymentTransaction(*tx, record);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    throw util::DuplicateTransaction("transaction " + webhook.id + " already recorded");
  }
  db::ThrowIfDbError(inserted, "record payment transaction");

  const auto payment = repository_->GetPayment(*tx, payment_id);
  if (!payment) {
    throw util::PaymentNotFound("payment " + std::to_string(payment_id) + " not found");
  }

  const auto orders = repository_->ListOrdersByPayment(*tx, payment_id);
  if (orders.empty()) {
    throw util::PaymentNotFound("payment " + std::to_string(payment_id) + " has no orders");
  }

  const auto expected = ExpectedTotal(orders);
  if (expected != webhook.transfer_amount) {
    throw util::AmountMismatch("payment " + std::to_string(payment_id) + " expects " + std::to_string(expected) + ", received " +
                               std::to_string(webhook.transfer_amount));
  }

  SettlementResult result;
  result.buyer_id = orders.front().user_id;

  if (CanTransition(payment->status, PaymentStatus::kSuccess)) {
    db::ThrowIfDbError(repository_->UpdatePaymentStatus(*tx, payment_id, payment->status, PaymentStatus::kSuccess),
                       "mark payment success");
    for (const auto& order : orders) {
      if (!CanTransition(order.status, OrderStatus::kPendingPickup)) continue;
      db::ThrowIfDbError(repository_->UpdateOrderStatus(*tx, order.id, order.status, OrderStatus::kPendingPickup, std::nullopt),
                         "mark order pending pickup");
    }
    scheduler_->Cancel(*tx, payment_id);
    result.applied = true;
  }

  tx->Commit();

  observability::Metrics::Instance().RecordSettlement(result.applied ? "applied" : "ignored");
  CHECKOUT_LOG_INFO("payment webhook settled", {StringField("transaction_id", webhook.id), IntField("payment_id", payment_id),
                                                IntField("buyer_id", result.buyer_id), BoolField("applied", result.applied)});
  return result;
}

void SettlementService::Expire(int64_t payment_id) {
  observability::SpanScope span("payment.Expire");
  span.SetAttribute("payment_id", payment_id);

  auto tx = repository_->Begin();

  // The payment guard makes a redelivered job a no-op; stock comes back once.
  const auto payment = repository_->GetPayment(*tx, payment_id);
  if (!payment || !CanTransition(payment->status, PaymentStatus::kFailed)) {
    tx->Rollback();
    CHECKOUT_LOG_DEBUG("expire skipped", {IntField("payment_id", payment_id), BoolField("exists", payment.has_value())});
    return;
  }

  // Orders the buyer already cancelled by hand still hold their units;
  // this is the only place those units return to stock.
  int64_t restored = 0;
  for (const auto& order : repository_->ListOrdersByPayment(*tx, payment_id)) {
    if (CanTransition(order.status, OrderStatus::kCancelled)) {
      db::ThrowIfDbError(repository_->UpdateOrderStatus(*tx, order.id, order.status, OrderStatus::kCancelled, std::nullopt),
                         "cancel expired order");
    }

    for (const auto& item : order.items) {
      if (!item.sku_id) continue;
      if (ledger_->Increment(*tx, *item.sku_id, item.snapshot.quantity)) {
        restored += item.snapshot.quantity;
      }
    }
  }

  db::ThrowIfDbError(repository_->UpdatePaymentStatus(*tx, payment_id, payment->status, PaymentStatus::kFailed),
                     "mark payment failed");
  tx->Commit();

  observability::Metrics::Instance().RecordSettlement("expired");
  CHECKOUT_LOG_INFO("unpaid checkout expired", {IntField("payment_id", payment_id), IntField("restored_units", restored)});

  InvalidateProductList(payment_id);
}

db::model::OrderRecord SettlementService::CancelOrder(int64_t buyer_id, int64_t order_id) {
  auto tx = repository_->Begin();

  auto order = repository_->GetOrder(*tx, order_id);
  if (!order || order->user_id != buyer_id || order->deleted_at_ms) {
    throw util::OrderNotFound("order " + std::to_string(order_id) + " not found");
  }
  if (!CanTransition(order->status, OrderStatus::kCancelled)) {
    throw util::CannotCancel("order " + std::to_string(order_id) + " is " + std::string(checkout::model::ToString(order->status)));
  }

  const auto updated = repository_->UpdateOrderStatus(*tx, order_id, order->status, OrderStatus::kCancelled, buyer_id);
  if (updated.code == db::ErrorCode::Conflict) {
    throw util::CannotCancel("order " + std::to_string(order_id) + " changed status concurrently");
  }
  db::ThrowIfDbError(updated, "cancel order");

  auto result = repository_->GetOrder(*tx, order_id);
  tx->Commit();

  observability::Metrics::Instance().RecordSettlement("cancelled");
  CHECKOUT_LOG_INFO("order cancelled by buyer", {IntField("order_id", order_id), IntField("buyer_id", buyer_id)});
  return result ? *result : *order;
}

void SettlementService::InvalidateProductList(int64_t payment_id) noexcept {
  try {
    cache_->Invalidate(cache::kProductList);
  } catch (const std::exception& e) {
    CHECKOUT_LOG_WARN("product-list invalidation failed", {IntField("payment_id", payment_id), StringField("error", e.what())});
  }
}

} // namespace checkout::core
