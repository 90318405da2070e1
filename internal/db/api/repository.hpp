#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_record.hpp"
#include "internal/db/model/delayed_job_record.hpp"
#include "internal/db/model/order_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/model/state_machine.hpp"

namespace checkout::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Guarded updates (stock, statuses) check and write in one statement
    and report Conflict when the guard does not hold
  - Order/payment/stock correctness depends on this behavior

  The DB is the source of truth for:
    stock
    orders and their snapshots
    payment state
    pending delayed jobs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Catalog (seeded by the catalog service; read by checkout)
  // ---------------------------------------------------------------------

  // Assigns product and translation ids when zero.
  virtual Result InsertProduct(Transaction&, model::ProductRecord&) = 0;

  virtual Result InsertSku(Transaction&, model::SkuRecord&) = 0;

  virtual std::optional<model::SkuRecord> GetSku(Transaction&, int64_t sku_id) = 0;

  // Catalog edit of a SKU row. Always bumps the version.
  virtual Result UpdateSku(Transaction&, const model::SkuRecord&) = 0;

  // Hard delete. Order items keep their snapshot with sku_id cleared.
  virtual Result DeleteSku(Transaction&, int64_t sku_id) = 0;

  // ---------------------------------------------------------------------
  // Cart
  // ---------------------------------------------------------------------

  virtual Result InsertCartItem(Transaction&, model::CartItemRecord&) = 0;

  // Cart items of user_id among ids, joined with SKU and product.
  // Missing ids are silently absent from the result.
  virtual std::vector<model::CartLine> GetCartLines(Transaction&, int64_t user_id, const std::vector<int64_t>& ids) = 0;

  virtual Result DeleteCartItems(Transaction&, const std::vector<int64_t>& ids) = 0;

  // ---------------------------------------------------------------------
  // Stock ledger
  // ---------------------------------------------------------------------

  // Conflict unless version == expected_version AND stock >= quantity.
  virtual Result DecrementStock(Transaction&, int64_t sku_id, int64_t quantity, uint64_t expected_version) = 0;

  // NotFound when the SKU row no longer exists.
  virtual Result IncrementStock(Transaction&, int64_t sku_id, int64_t quantity) = 0;

  // ---------------------------------------------------------------------
  // Payments
  // ---------------------------------------------------------------------

  virtual Result InsertPayment(Transaction&, model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, int64_t payment_id) = 0;

  // Conflict when the current status is not `from`.
  virtual Result UpdatePaymentStatus(Transaction&, int64_t payment_id, checkout::model::PaymentStatus from,
                                     checkout::model::PaymentStatus to) = 0;

  // AlreadyExists when the gateway id was seen before.
  virtual Result InsertPaymentTransaction(Transaction&, const model::PaymentTransactionRecord&) = 0;

  virtual std::optional<model::PaymentTransactionRecord> GetPaymentTransaction(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Orders
  // ---------------------------------------------------------------------

  // Assigns order and item ids.
  virtual Result InsertOrder(Transaction&, model::OrderRecord&) = 0;

  // Orders below include their items.
  virtual std::optional<model::OrderRecord> GetOrder(Transaction&, int64_t order_id) = 0;

  virtual std::vector<model::OrderRecord> ListOrdersByPayment(Transaction&, int64_t payment_id) = 0;

  // Newest first; soft-deleted orders excluded.
  virtual std::vector<model::OrderRecord> ListOrders(Transaction&, const model::OrderFilter&) = 0;

  virtual uint64_t CountOrders(Transaction&, const model::OrderFilter&) = 0;

  // Conflict when the current status is not `from`.
  virtual Result UpdateOrderStatus(Transaction&, int64_t order_id, checkout::model::OrderStatus from, checkout::model::OrderStatus to,
                                   std::optional<int64_t> updated_by) = 0;

  // ---------------------------------------------------------------------
  // Delayed jobs
  // ---------------------------------------------------------------------

  // Insert or replace by id.
  virtual Result UpsertDelayedJob(Transaction&, const model::DelayedJobRecord&) = 0;

  // OK when absent.
  virtual Result DeleteDelayedJob(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::DelayedJobRecord> GetDelayedJob(Transaction&, const std::string& id) = 0;

  // Jobs with run_at_ms <= now_ms, oldest first.
  virtual std::vector<model::DelayedJobRecord> ListDueDelayedJobs(Transaction&, uint64_t now_ms, std::size_t limit) = 0;
};

} // namespace checkout::db
