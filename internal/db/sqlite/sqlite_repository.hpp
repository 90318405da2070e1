#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace checkout::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProduct(Transaction&, model::ProductRecord&) override;
  Result InsertSku(Transaction&, model::SkuRecord&) override;
  std::optional<model::SkuRecord> GetSku(Transaction&, int64_t) override;
  Result UpdateSku(Transaction&, const model::SkuRecord&) override;
  Result DeleteSku(Transaction&, int64_t) override;

  Result InsertCartItem(Transaction&, model::CartItemRecord&) override;
  std::vector<model::CartLine> GetCartLines(Transaction&, int64_t user_id, const std::vector<int64_t>& ids) override;
  Result DeleteCartItems(Transaction&, const std::vector<int64_t>& ids) override;

  Result DecrementStock(Transaction&, int64_t sku_id, int64_t quantity, uint64_t expected_version) override;
  Result IncrementStock(Transaction&, int64_t sku_id, int64_t quantity) override;

  Result InsertPayment(Transaction&, model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, int64_t) override;
  Result UpdatePaymentStatus(Transaction&, int64_t, checkout::model::PaymentStatus from,
                             checkout::model::PaymentStatus to) override;
  Result InsertPaymentTransaction(Transaction&, const model::PaymentTransactionRecord&) override;
  std::optional<model::PaymentTransactionRecord> GetPaymentTransaction(Transaction&, const std::string&) override;

  Result InsertOrder(Transaction&, model::OrderRecord&) override;
  std::optional<model::OrderRecord> GetOrder(Transaction&, int64_t) override;
  std::vector<model::OrderRecord> ListOrdersByPayment(Transaction&, int64_t payment_id) override;
  std::vector<model::OrderRecord> ListOrders(Transaction&, const model::OrderFilter&) override;
  uint64_t CountOrders(Transaction&, const model::OrderFilter&) override;
  Result UpdateOrderStatus(Transaction&, int64_t, checkout::model::OrderStatus from, checkout::model::OrderStatus to,
                           std::optional<int64_t> updated_by) override;

  Result UpsertDelayedJob(Transaction&, const model::DelayedJobRecord&) override;
  Result DeleteDelayedJob(Transaction&, const std::string&) override;
  std::optional<model::DelayedJobRecord> GetDelayedJob(Transaction&, const std::string&) override;
  std::vector<model::DelayedJobRecord> ListDueDelayedJobs(Transaction&, uint64_t now_ms, std::size_t limit) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  static std::vector<model::OrderItemRecord> LoadItems(sqlite3* db, int64_t order_id);
  static std::vector<model::TranslationRecord> LoadTranslations(sqlite3* db, int64_t product_id);
};

}
