#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/checkout_fixture.hpp"

#if CHECKOUT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if CHECKOUT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using checkout::db::ErrorCode;
using checkout::db::Repository;
using checkout::db::memory::MemoryRepository;
using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;
namespace model = checkout::db::model;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

struct Seed {
  int64_t product = 0;
  int64_t sku     = 0;
  int64_t cart    = 0;
};

Seed SeedCatalog(Repository& repo, int64_t user_id, int64_t stock) {
  Seed seed;
  auto tx = repo.Begin();

  model::ProductRecord product;
  product.name            = "Kettle";
  product.published_at_ms = NowMs() - 1000;
  product.translations    = {{0, "en", "Kettle", "1.7L"}, {0, "fr", "Bouilloire", ""}};
  const auto p            = repo.InsertProduct(*tx, product);
  assert(p);
  seed.product = product.id;

  model::SkuRecord sku;
  sku.product_id = product.id;
  sku.created_by = 50;
  sku.value      = "Steel";
  sku.price      = 300;
  sku.image      = "kettle.png";
  sku.stock      = stock;
  const auto s   = repo.InsertSku(*tx, sku);
  assert(s);
  seed.sku = sku.id;

  model::CartItemRecord item;
  item.user_id  = user_id;
  item.sku_id   = sku.id;
  item.quantity = 2;
  const auto c  = repo.InsertCartItem(*tx, item);
  assert(c);
  seed.cart = item.id;

  tx->Commit();
  return seed;
}

model::OrderRecord MakeOrder(const Seed& seed, int64_t user_id, int64_t payment_id) {
  model::OrderRecord order;
  order.user_id    = user_id;
  order.shop_id    = 50;
  order.payment_id = payment_id;
  order.status     = OrderStatus::kPendingPayment;
  order.receiver   = {"Le C", "0911", "2 Hai Ba Trung"};
  order.created_by = user_id;

  model::OrderItemRecord item;
  item.sku_id                = seed.sku;
  item.product_id            = seed.product;
  item.snapshot.product_name = "Kettle";
  item.snapshot.sku_price    = 300;
  item.snapshot.image        = "kettle.png";
  item.snapshot.sku_value    = "Steel";
  item.snapshot.quantity     = 2;
  item.snapshot.translations = {{1, "en", "Kettle", "1.7L"}};
  order.items.push_back(item);
  return order;
}

void VerifyCatalogAndCart(Repository& repo) {
  const auto seed = SeedCatalog(repo, 1, 10);

  auto tx    = repo.Begin();
  auto lines = repo.GetCartLines(*tx, 1, {seed.cart, 424242});
  assert(lines.size() == 1);
  assert(lines[0].item.quantity == 2);
  assert(lines[0].sku.id == seed.sku);
  assert(lines[0].sku.created_by == 50);
  assert(lines[0].product.name == "Kettle");
  assert(lines[0].product.translations.size() == 2);
  assert(lines[0].product.published_at_ms.has_value());

  // other users never see the item
  assert(repo.GetCartLines(*tx, 2, {seed.cart}).empty());

  const auto deleted = repo.DeleteCartItems(*tx, {seed.cart});
  assert(deleted);
  assert(repo.GetCartLines(*tx, 1, {seed.cart}).empty());
  tx->Commit();
}

void VerifyGuardedStock(Repository& repo) {
  const auto seed = SeedCatalog(repo, 1, 3);

  auto       tx      = repo.Begin();
  const auto version = repo.GetSku(*tx, seed.sku)->version;

  assert(repo.DecrementStock(*tx, seed.sku, 2, version));
  assert(repo.DecrementStock(*tx, seed.sku, 1, version).code == ErrorCode::Conflict);
  assert(repo.DecrementStock(*tx, seed.sku, 5, version + 1).code == ErrorCode::Conflict);

  auto sku = repo.GetSku(*tx, seed.sku);
  assert(sku->stock == 1);
  assert(sku->version == version + 1);

  assert(repo.IncrementStock(*tx, seed.sku, 4));
  assert(repo.IncrementStock(*tx, 987654, 1).code == ErrorCode::NotFound);
  sku = repo.GetSku(*tx, seed.sku);
  assert(sku->stock == 5);
  assert(sku->version == version + 2);

  sku->price = 450;
  assert(repo.UpdateSku(*tx, *sku));
  assert(repo.GetSku(*tx, seed.sku)->version == version + 3);
  tx->Commit();
}

void VerifyPaymentsAndTransactions(Repository& repo, const std::string& txn_id) {
  auto tx = repo.Begin();

  model::PaymentRecord payment;
  payment.status = PaymentStatus::kPending;
  assert(repo.InsertPayment(*tx, payment));
  assert(payment.id > 0);
  assert(payment.created_at_ms > 0);

  assert(repo.UpdatePaymentStatus(*tx, payment.id, PaymentStatus::kPending, PaymentStatus::kSuccess));
  assert(repo.UpdatePaymentStatus(*tx, payment.id, PaymentStatus::kPending, PaymentStatus::kFailed).code == ErrorCode::Conflict);
  assert(repo.UpdatePaymentStatus(*tx, 987654, PaymentStatus::kPending, PaymentStatus::kFailed).code == ErrorCode::NotFound);
  assert(repo.GetPayment(*tx, payment.id)->status == PaymentStatus::kSuccess);

  model::PaymentTransactionRecord record;
  record.id               = txn_id;
  record.gateway          = "VCB";
  record.transaction_date = "2024-05-01 10:00:00";
  record.account_number   = "001";
  record.code             = "DH" + std::to_string(payment.id);
  record.amount_in        = 600;
  record.reference_code   = "FT1";
  record.created_at_ms    = NowMs();
  assert(repo.InsertPaymentTransaction(*tx, record));
  tx->Commit();

  auto tx2 = repo.Begin();
  assert(repo.InsertPaymentTransaction(*tx2, record).code == ErrorCode::AlreadyExists);
  tx2->Rollback();

  auto tx3    = repo.Begin();
  auto stored = repo.GetPaymentTransaction(*tx3, txn_id);
  assert(stored.has_value());
  assert(stored->code == record.code);
  assert(!stored->content.has_value());
  assert(stored->amount_in == 600);
  tx3->Commit();
}

void VerifyOrders(Repository& repo) {
  constexpr int64_t kUser = 31;
  const auto        seed  = SeedCatalog(repo, kUser, 10);

  auto tx = repo.Begin();

  model::PaymentRecord payment;
  payment.status = PaymentStatus::kPending;
  assert(repo.InsertPayment(*tx, payment));

  std::vector<int64_t> ids;
  for (int i = 0; i < 3; ++i) {
    auto order = MakeOrder(seed, kUser, payment.id);
    assert(repo.InsertOrder(*tx, order));
    assert(order.id > 0);
    assert(order.items[0].id > 0);
    assert(order.items[0].order_id == order.id);
    ids.push_back(order.id);
  }
  tx->Commit();

  auto tx2   = repo.Begin();
  auto order = repo.GetOrder(*tx2, ids[0]);
  assert(order.has_value());
  assert(order->receiver.phone == "0911");
  assert(order->items.size() == 1);
  assert(order->items[0].snapshot.translations.size() == 1);
  assert(order->items[0].snapshot.translations[0].language_id == "en");
  assert(*order->items[0].sku_id == seed.sku);

  assert(repo.ListOrdersByPayment(*tx2, payment.id).size() == 3);

  assert(repo.UpdateOrderStatus(*tx2, ids[1], OrderStatus::kPendingPayment, OrderStatus::kCancelled, kUser));
  assert(repo.UpdateOrderStatus(*tx2, ids[1], OrderStatus::kPendingPayment, OrderStatus::kPendingPickup, std::nullopt).code ==
         ErrorCode::Conflict);
  assert(repo.UpdateOrderStatus(*tx2, 987654, OrderStatus::kPendingPayment, OrderStatus::kCancelled, std::nullopt).code ==
         ErrorCode::NotFound);
  assert(repo.GetOrder(*tx2, ids[1])->updated_by == kUser);

  model::OrderFilter filter;
  filter.user_id = kUser;
  filter.limit   = 2;
  assert(repo.CountOrders(*tx2, filter) == 3);
  auto page = repo.ListOrders(*tx2, filter);
  assert(page.size() == 2);
  assert(page[0].id == ids[2]);
  assert(page[1].id == ids[1]);
  filter.offset = 2;
  page          = repo.ListOrders(*tx2, filter);
  assert(page.size() == 1);
  assert(page[0].id == ids[0]);

  filter.offset = 0;
  filter.status = OrderStatus::kCancelled;
  assert(repo.CountOrders(*tx2, filter) == 1);
  tx2->Commit();

  // removing the sku keeps the snapshot and clears the reference
  auto tx3 = repo.Begin();
  assert(repo.DeleteSku(*tx3, seed.sku));
  order = repo.GetOrder(*tx3, ids[0]);
  assert(!order->items[0].sku_id.has_value());
  assert(order->items[0].product_id == seed.product);
  assert(order->items[0].snapshot.sku_price == 300);
  assert(repo.GetCartLines(*tx3, kUser, {seed.cart}).empty());
  tx3->Commit();
}

void VerifyDelayedJobs(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  model::DelayedJobRecord job;
  job.id            = prefix + "-a";
  job.type          = "cancel-payment";
  job.payload       = R"({"data":{"paymentId":1}})";
  job.run_at_ms     = 2000;
  job.created_at_ms = 1000;
  assert(repo.UpsertDelayedJob(*tx, job));

  job.run_at_ms = 3000;
  job.attempts  = 2;
  assert(repo.UpsertDelayedJob(*tx, job));

  auto other      = job;
  other.id        = prefix + "-b";
  other.run_at_ms = 2500;
  other.attempts  = 0;
  assert(repo.UpsertDelayedJob(*tx, other));

  auto due = repo.ListDueDelayedJobs(*tx, 3000, 10);
  assert(due.size() == 2);
  assert(due[0].id == prefix + "-b");
  assert(due[1].id == prefix + "-a");
  assert(due[1].attempts == 2);

  assert(repo.ListDueDelayedJobs(*tx, 2600, 10).size() == 1);
  assert(repo.ListDueDelayedJobs(*tx, 3000, 1).size() == 1);

  assert(repo.DeleteDelayedJob(*tx, prefix + "-a"));
  assert(repo.DeleteDelayedJob(*tx, prefix + "-a"));
  assert(repo.DeleteDelayedJob(*tx, prefix + "-b"));
  assert(!repo.GetDelayedJob(*tx, prefix + "-a").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  int64_t payment_id = 0;
  {
    auto tx = repo.Begin();

    model::PaymentRecord payment;
    payment.status = PaymentStatus::kPending;
    assert(repo.InsertPayment(*tx, payment));
    payment_id = payment.id;
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetPayment(*tx, payment_id).has_value());
  tx->Commit();
}

void VerifyPipeline(std::shared_ptr<Repository> repo) {
  checkout::testing::CheckoutFixture f(std::move(repo));

  const auto sku    = f.AddSku(f.AddProduct("Pipeline"), 60, 25'000, 5);
  const auto sale   = f.orchestrator->Checkout(70, {f.Group(60, {f.AddCartItem(70, sku, 5)})});
  const auto second = f.AddCartItem(71, sku, 1);
  assert(f.Sku(sku).stock == 0);

  bool threw = false;
  try {
    f.orchestrator->Checkout(71, {f.Group(60, {second})});
  } catch (const checkout::util::OutOfStock&) {
    threw = true;
  }
  assert(threw);

  f.settlement->Expire(sale.payment_id);
  assert(f.Sku(sku).stock == 5);
  assert(f.Payment(sale.payment_id)->status == PaymentStatus::kFailed);

  const auto paid = f.orchestrator->Checkout(71, {f.Group(60, {second})});
  const auto res  = f.settlement->Settle(f.TransferFor(paid.payment_id, 25'000, "pipeline-" + std::to_string(NowMs())));
  assert(res.applied);
  assert(f.Order(paid.orders[0].id)->status == OrderStatus::kPendingPickup);
  assert(!f.CancelJob(paid.payment_id).has_value());
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  const auto seed = SeedCatalog(*repo, 90, 7);

  int64_t order_id = 0;
  {
    auto tx = repo->Begin();
    model::PaymentRecord payment;
    payment.status = PaymentStatus::kPending;
    assert(repo->InsertPayment(*tx, payment));
    auto order = MakeOrder(seed, 90, payment.id);
    assert(repo->InsertOrder(*tx, order));
    order_id = order.id;
    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto order = repo->GetOrder(*tx, order_id);
  assert(order.has_value());
  assert(order->items.size() == 1);
  assert(order->items[0].snapshot.product_name == "Kettle");
  assert(repo->GetSku(*tx, seed.sku)->stock == 7);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if CHECKOUT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("checkout_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<checkout::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : checkout::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<checkout::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if CHECKOUT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CHECKOUT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CHECKOUT_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  {
    auto       pool = std::make_shared<checkout::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    for (const auto& sql : checkout::db::sql::PostgresSchema()) {
      tx.exec(sql);
    }
    tx.exec(
        "TRUNCATE order_item, orders, payment_transaction, payment, cart_item, sku, product_translation, product, delayed_job "
        "RESTART IDENTITY CASCADE");
    tx.commit();
  }

  auto make_repo = [conninfo]() {
    return std::make_shared<checkout::db::postgres::PgRepository>(std::make_shared<checkout::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyCatalogAndCart(*repo);
    VerifyGuardedStock(*repo);
    VerifyPaymentsAndTransactions(*repo, backend.name + "-txn-" + std::to_string(NowMs()));
    VerifyOrders(*repo);
    VerifyDelayedJobs(*repo, backend.name + "-job");
    VerifyRollbackBehavior(*repo);
    VerifyPipeline(repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CHECKOUT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CHECKOUT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "checkout_manager_integration_repository_parity: pass\n";
  return 0;
}
