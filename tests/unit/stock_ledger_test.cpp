#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using checkout::db::memory::MemoryRepository;
using checkout::ledger::StockLedger;

struct Catalog {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  StockLedger                       ledger{repository};

  int64_t AddSku(int64_t stock) {
    checkout::db::model::ProductRecord product;
    product.name = "Widget";

    checkout::db::model::SkuRecord sku;
    sku.created_by = 1;
    sku.price      = 10;
    sku.stock      = stock;

    auto tx = repository->Begin();
    const auto p = repository->InsertProduct(*tx, product);
    assert(p);
    sku.product_id = product.id;
    const auto s   = repository->InsertSku(*tx, sku);
    assert(s);
    tx->Commit();
    return sku.id;
  }

  checkout::db::model::SkuRecord Get(int64_t id) {
    auto tx  = repository->Begin();
    auto sku = repository->GetSku(*tx, id);
    tx->Commit();
    return *sku;
  }
};

bool DecrementConflicts(Catalog& c, int64_t sku, int64_t quantity, uint64_t version) {
  auto tx = c.repository->Begin();
  try {
    c.ledger.Decrement(*tx, sku, quantity, version);
  } catch (const checkout::util::VersionConflict&) {
    return true;
  }
  tx->Commit();
  return false;
}

void TestDecrementBumpsVersion() {
  Catalog    c;
  const auto sku  = c.AddSku(5);
  const auto live = c.Get(sku);

  assert(!DecrementConflicts(c, sku, 3, live.version));

  const auto after = c.Get(sku);
  assert(after.stock == 2);
  assert(after.version == live.version + 1);
}

void TestStaleVersionConflicts() {
  Catalog    c;
  const auto sku   = c.AddSku(5);
  const auto stale = c.Get(sku).version;

  assert(!DecrementConflicts(c, sku, 1, stale));
  assert(DecrementConflicts(c, sku, 1, stale));
  assert(c.Get(sku).stock == 4);
}

void TestDecrementNeverClamps() {
  Catalog    c;
  const auto sku = c.AddSku(2);

  assert(DecrementConflicts(c, sku, 3, c.Get(sku).version));
  assert(c.Get(sku).stock == 2);

  assert(!DecrementConflicts(c, sku, 2, c.Get(sku).version));
  assert(c.Get(sku).stock == 0);
}

void TestNonPositiveQuantityIsInvalid() {
  Catalog    c;
  const auto sku     = c.AddSku(2);
  const auto version = c.Get(sku).version;

  bool threw = false;
  auto tx    = c.repository->Begin();
  try {
    c.ledger.Decrement(*tx, sku, 0, version);
  } catch (const checkout::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestIncrementRestoresAndReportsMissingSku() {
  Catalog    c;
  const auto sku     = c.AddSku(0);
  const auto version = c.Get(sku).version;

  {
    auto tx = c.repository->Begin();
    assert(c.ledger.Increment(*tx, sku, 4));
    assert(!c.ledger.Increment(*tx, 9999, 4));
    tx->Commit();
  }

  const auto after = c.Get(sku);
  assert(after.stock == 4);
  assert(after.version == version + 1);
}

void TestRolledBackDecrementLeavesStock() {
  Catalog    c;
  const auto sku = c.AddSku(5);
  {
    auto tx = c.repository->Begin();
    c.ledger.Decrement(*tx, sku, 5, c.repository->GetSku(*tx, sku)->version);
    // no commit
  }
  assert(c.Get(sku).stock == 5);
}

} // namespace

int main() {
  TestDecrementBumpsVersion();
  TestStaleVersionConflicts();
  TestDecrementNeverClamps();
  TestNonPositiveQuantityIsInvalid();
  TestIncrementRestoresAndReportsMissingSku();
  TestRolledBackDecrementLeavesStock();

  std::cout << "checkout_manager_unit_stock_ledger: pass\n";
  return 0;
}
