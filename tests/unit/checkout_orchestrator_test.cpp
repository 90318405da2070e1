#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "tests/support/checkout_fixture.hpp"

namespace {

using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;
using checkout::testing::CheckoutFixture;

constexpr int64_t kBuyer      = 101;
constexpr int64_t kOtherBuyer = 102;
constexpr int64_t kShop       = 7;
constexpr int64_t kOtherShop  = 8;

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn, const char* what) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "expected exception: " << what << "\n";
  }
  assert(threw);
}

void TestCheckoutConsumesStockAndSchedulesCancellation() {
  CheckoutFixture f;
  const auto product = f.AddProduct("Lamp");
  const auto sku     = f.AddSku(product, kShop, 25'000, 5);
  const auto cart    = f.AddCartItem(kBuyer, sku, 5);

  const auto before = checkout::util::ToUnixMillis(checkout::util::Now());
  const auto result = f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})});

  assert(result.payment_id > 0);
  assert(result.orders.size() == 1);
  assert(result.orders[0].status == OrderStatus::kPendingPayment);
  assert(result.orders[0].user_id == kBuyer);
  assert(result.orders[0].shop_id == kShop);
  assert(result.orders[0].created_by == kBuyer);
  assert(result.orders[0].items.size() == 1);
  assert(result.orders[0].items[0].snapshot.quantity == 5);
  assert(result.orders[0].items[0].snapshot.sku_price == 25'000);

  assert(f.Sku(sku).stock == 0);
  assert(f.Payment(result.payment_id)->status == PaymentStatus::kPending);

  const auto job = f.CancelJob(result.payment_id);
  assert(job.has_value());
  assert(job->type == checkout::scheduler::CancellationScheduler::kJobType);
  assert(job->run_at_ms >= before + 86'400'000);
  assert(checkout::scheduler::CancellationScheduler::DecodePaymentId(job->payload) == result.payment_id);

  // cart item consumed, product list invalidated, leases released
  auto tx = f.repository->Begin();
  assert(f.repository->GetCartLines(*tx, kBuyer, {cart}).empty());
  tx->Commit();
  assert(f.invalidator->Version(checkout::cache::kProductList) == 1);
  assert(f.locks->ActiveCount() == 0);
}

void TestSecondBuyerIsRejectedOnceStockIsGone() {
  CheckoutFixture f;
  const auto product = f.AddProduct("Lamp");
  const auto sku     = f.AddSku(product, kShop, 25'000, 5);
  const auto first   = f.AddCartItem(kBuyer, sku, 5);
  const auto second  = f.AddCartItem(kOtherBuyer, sku, 1);

  f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {first})});

  ExpectThrows<checkout::util::OutOfStock>([&] { f.orchestrator->Checkout(kOtherBuyer, {f.Group(kShop, {second})}); },
                                           "second buyer out of stock");
  assert(f.Sku(sku).stock == 0);
  assert(f.locks->ActiveCount() == 0);
}

void TestQuantityIsAggregatedPerSku() {
  CheckoutFixture f;
  const auto product = f.AddProduct("Mug");
  const auto sku     = f.AddSku(product, kShop, 10, 3);
  const auto a       = f.AddCartItem(kBuyer, sku, 2);
  const auto b       = f.AddCartItem(kBuyer, sku, 2);

  ExpectThrows<checkout::util::OutOfStock>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {a, b})}); },
                                           "2 + 2 exceeds stock 3");
  assert(f.Sku(sku).stock == 3);
}

void TestMultiSellerCheckoutCreatesOneOrderPerGroup() {
  CheckoutFixture f;
  const auto p1   = f.AddProduct("Pen");
  const auto p2   = f.AddProduct("Notebook");
  const auto sku1 = f.AddSku(p1, kShop, 5, 10);
  const auto sku2 = f.AddSku(p2, kOtherShop, 20, 4);
  const auto c1   = f.AddCartItem(kBuyer, sku1, 3);
  const auto c2   = f.AddCartItem(kBuyer, sku2, 1);

  const auto result = f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {c1}), f.Group(kOtherShop, {c2})});

  assert(result.orders.size() == 2);
  for (const auto& order : result.orders) {
    assert(order.payment_id == result.payment_id);
  }
  assert(f.Sku(sku1).stock == 7);
  assert(f.Sku(sku2).stock == 3);
}

void TestMissingCartItemRejectsWholeRequest() {
  CheckoutFixture f;
  const auto product  = f.AddProduct("Lamp");
  const auto sku      = f.AddSku(product, kShop, 100, 5);
  const auto cart     = f.AddCartItem(kBuyer, sku, 1);
  const auto foreign  = f.AddCartItem(kOtherBuyer, sku, 1);

  ExpectThrows<checkout::util::CartItemNotFound>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart, 9999})}); },
                                                 "unknown cart item");
  ExpectThrows<checkout::util::CartItemNotFound>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart, foreign})}); },
                                                 "another buyer's cart item");

  // nothing committed
  assert(f.Sku(sku).stock == 5);
  assert(!f.Payment(1).has_value());
  auto tx = f.repository->Begin();
  assert(f.repository->GetCartLines(*tx, kBuyer, {cart}).size() == 1);
  tx->Commit();
}

void TestUnavailableProductsAreRejected() {
  CheckoutFixture f;
  const auto now = checkout::util::ToUnixMillis(checkout::util::Now());

  const auto unpublished = f.AddSku(f.AddProduct("Draft", std::nullopt), kShop, 10, 5);
  const auto scheduled   = f.AddSku(f.AddProduct("Soon", now + 3'600'000), kShop, 10, 5);

  checkout::db::model::ProductRecord removed;
  removed.name            = "Gone";
  removed.published_at_ms = CheckoutFixture::PublishedYesterday();
  removed.deleted_at_ms   = now;
  {
    auto tx = f.repository->Begin();
    const auto inserted = f.repository->InsertProduct(*tx, removed);
    assert(inserted);
    tx->Commit();
  }
  const auto deleted = f.AddSku(removed.id, kShop, 10, 5);

  for (auto sku : {unpublished, scheduled, deleted}) {
    const auto cart = f.AddCartItem(kBuyer, sku, 1);
    ExpectThrows<checkout::util::ProductUnavailable>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})}); },
                                                     "unavailable product");
    assert(f.Sku(sku).stock == 5);
  }
}

void TestSkuFromAnotherSellerIsRejected() {
  CheckoutFixture f;
  const auto sku  = f.AddSku(f.AddProduct("Lamp"), kOtherShop, 10, 5);
  const auto cart = f.AddCartItem(kBuyer, sku, 1);

  ExpectThrows<checkout::util::SellerMismatch>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})}); },
                                               "seller mismatch");
  assert(f.Sku(sku).stock == 5);
}

void TestEmptyRequestsAreInvalid() {
  CheckoutFixture f;
  ExpectThrows<checkout::util::InvalidArgument>([&] { f.orchestrator->Checkout(kBuyer, {}); }, "no groups");
  ExpectThrows<checkout::util::InvalidArgument>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {})}); },
                                                "group without cart items");
}

void TestHeldLeaseFailsFastWithoutSideEffects() {
  CheckoutFixture f;
  const auto sku  = f.AddSku(f.AddProduct("Lamp"), kShop, 10, 5);
  const auto cart = f.AddCartItem(kBuyer, sku, 1);

  const auto held = f.locks->Acquire(checkout::lock::SkuLockKeys({sku}), std::chrono::seconds(30));

  ExpectThrows<checkout::util::LockUnavailable>([&] { f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})}); },
                                                "sku lease held");
  assert(f.Sku(sku).stock == 5);
  assert(f.locks->ActiveCount() == 1);

  f.locks->Release(held);
  const auto result = f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})});
  assert(result.payment_id > 0);
  assert(f.Sku(sku).stock == 4);
}

void TestSnapshotSurvivesCatalogEdits() {
  CheckoutFixture f;
  const auto product = f.AddProduct("Lamp");
  const auto sku     = f.AddSku(product, kShop, 100, 5, "Red");
  const auto cart    = f.AddCartItem(kBuyer, sku, 2);

  const auto result   = f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})});
  const auto order_id = result.orders[0].id;

  {
    auto live  = f.Sku(sku);
    live.price = 999;
    live.value = "Blue";
    auto tx    = f.repository->Begin();
    const auto updated = f.repository->UpdateSku(*tx, live);
    assert(updated);
    tx->Commit();
  }

  auto order = f.Order(order_id);
  assert(order->items[0].snapshot.sku_price == 100);
  assert(order->items[0].snapshot.sku_value == "Red");
  assert(order->items[0].snapshot.product_name == "Lamp");
  assert(order->items[0].snapshot.translations.size() == 2);

  {
    auto tx = f.repository->Begin();
    const auto deleted = f.repository->DeleteSku(*tx, sku);
    assert(deleted);
    tx->Commit();
  }

  order = f.Order(order_id);
  assert(!order->items[0].sku_id.has_value());
  assert(order->items[0].snapshot.sku_price == 100);
}

void TestGetOrderIsScopedToBuyer() {
  CheckoutFixture f;
  const auto sku    = f.AddSku(f.AddProduct("Lamp"), kShop, 10, 5);
  const auto cart   = f.AddCartItem(kBuyer, sku, 1);
  const auto result = f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})});

  const auto order = f.orchestrator->GetOrder(kBuyer, result.orders[0].id);
  assert(order.id == result.orders[0].id);
  assert(order.items.size() == 1);

  ExpectThrows<checkout::util::OrderNotFound>([&] { f.orchestrator->GetOrder(kOtherBuyer, result.orders[0].id); },
                                              "other buyer's order");
  ExpectThrows<checkout::util::OrderNotFound>([&] { f.orchestrator->GetOrder(kBuyer, 424242); }, "unknown order");
}

void TestListOrdersPaginatesNewestFirst() {
  CheckoutFixture f;
  const auto sku = f.AddSku(f.AddProduct("Lamp"), kShop, 10, 100);

  std::vector<int64_t> created;
  for (int i = 0; i < 5; ++i) {
    const auto cart = f.AddCartItem(kBuyer, sku, 1);
    created.push_back(f.orchestrator->Checkout(kBuyer, {f.Group(kShop, {cart})}).orders[0].id);
  }
  const auto cancelled = created.back();
  f.settlement->CancelOrder(kBuyer, cancelled);

  checkout::core::OrderQuery query;
  query.page  = 1;
  query.limit = 2;
  auto page   = f.orchestrator->ListOrders(kBuyer, query);
  assert(page.total_items == 5);
  assert(page.total_pages == 3);
  assert(page.orders.size() == 2);
  assert(page.orders[0].id == created[4]);
  assert(page.orders[1].id == created[3]);

  query.page = 3;
  page       = f.orchestrator->ListOrders(kBuyer, query);
  assert(page.orders.size() == 1);
  assert(page.orders[0].id == created[0]);

  query.page   = 1;
  query.limit  = 10;
  query.status = OrderStatus::kCancelled;
  page         = f.orchestrator->ListOrders(kBuyer, query);
  assert(page.total_items == 1);
  assert(page.orders[0].id == cancelled);

  // defaults
  page = f.orchestrator->ListOrders(kBuyer, checkout::core::OrderQuery{0, 0, std::nullopt});
  assert(page.page == 1);
  assert(page.limit == 10);
  assert(page.orders.size() == 5);

  page = f.orchestrator->ListOrders(kOtherBuyer, {});
  assert(page.total_items == 0);
  assert(page.total_pages == 0);
}

} // namespace

int main() {
  TestCheckoutConsumesStockAndSchedulesCancellation();
  TestSecondBuyerIsRejectedOnceStockIsGone();
  TestQuantityIsAggregatedPerSku();
  TestMultiSellerCheckoutCreatesOneOrderPerGroup();
  TestMissingCartItemRejectsWholeRequest();
  TestUnavailableProductsAreRejected();
  TestSkuFromAnotherSellerIsRejected();
  TestEmptyRequestsAreInvalid();
  TestHeldLeaseFailsFastWithoutSideEffects();
  TestSnapshotSurvivesCatalogEdits();
  TestGetOrderIsScopedToBuyer();
  TestListOrdersPaginatesNewestFirst();

  std::cout << "checkout_manager_unit_checkout_orchestrator: pass\n";
  return 0;
}
