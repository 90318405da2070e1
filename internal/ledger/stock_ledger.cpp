#include "internal/ledger/stock_ledger.hpp"

#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace checkout::ledger {

using observability::IntField;

StockLedger::StockLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("stock ledger requires a repository");
  }
}

void StockLedger::Decrement(db::Transaction& tx, int64_t sku_id, int64_t quantity, uint64_t expected_version) {
  if (quantity <= 0) {
    throw util::InvalidArgument("decrement quantity must be positive");
  }

  const auto result = repository_->DecrementStock(tx, sku_id, quantity, expected_version);
  if (result.code == db::ErrorCode::Conflict) {
    CHECKOUT_LOG_WARN("stock version conflict",
                      {IntField("sku_id", sku_id), IntField("quantity", quantity),
                       IntField("expected_version", static_cast<int64_t>(expected_version))});
    throw util::VersionConflict("sku " + std::to_string(sku_id) + " changed concurrently");
  }
  db::ThrowIfDbError(result, "decrement stock");
}

bool StockLedger::Increment(db::Transaction& tx, int64_t sku_id, int64_t quantity) {
  const auto result = repository_->IncrementStock(tx, sku_id, quantity);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  db::ThrowIfDbError(result, "increment stock");
  return true;
}

} // namespace checkout::ledger
