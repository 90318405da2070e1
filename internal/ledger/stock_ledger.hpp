#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace checkout::ledger {

/*
  StockLedger

  The only writer of SKU stock outside catalog edits.

  Decrement is a single conditional update guarded by the version read
  earlier in the same transaction; it never clamps. Increment restores
  unconditionally and is used when an unpaid checkout expires.

  Both bump the SKU version.
*/
class StockLedger {
 public:
  explicit StockLedger(std::shared_ptr<db::Repository> repository);

  // Throws VersionConflict when the version moved or stock < quantity.
  void Decrement(db::Transaction& tx, int64_t sku_id, int64_t quantity, uint64_t expected_version);

  // false when the SKU row no longer exists.
  bool Increment(db::Transaction& tx, int64_t sku_id, int64_t quantity);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace checkout::ledger
