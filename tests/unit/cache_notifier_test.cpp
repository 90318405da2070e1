#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "internal/cache/cache_invalidator.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/service/payment_service.hpp"
#include "tests/support/checkout_fixture.hpp"

namespace {

using checkout::cache::MemoryCacheInvalidator;
using checkout::cache::VersionKey;

class FailingInvalidator final : public checkout::cache::CacheInvalidator {
 public:
  void Invalidate(std::string_view) override {
    ++attempts;
    throw std::runtime_error("cache store unreachable");
  }
  int attempts = 0;
};

class RecordingNotifier final : public checkout::notify::Notifier {
 public:
  struct Sent {
    int64_t     user_id;
    std::string event;
    std::string payload;
  };

  void NotifyUser(int64_t user_id, const std::string& event, const std::string& payload) noexcept override {
    std::lock_guard lock(mutex);
    sent.push_back({user_id, event, payload});
  }

  std::mutex        mutex;
  std::vector<Sent> sent;
};

void TestVersionKeysPerDomain() {
  assert(VersionKey(checkout::cache::kProductList) == "product:list:version");
  assert(VersionKey(checkout::cache::kBrandList) == "brand:list:version");
  assert(VersionKey(checkout::cache::kCategoryList) == "category:list:version");

  bool threw = false;
  try {
    (void)VersionKey("review-list");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidateBumpsOnlyItsDomain() {
  MemoryCacheInvalidator cache;
  cache.Invalidate(checkout::cache::kProductList);
  cache.Invalidate(checkout::cache::kProductList);
  cache.Invalidate(checkout::cache::kBrandList);

  assert(cache.Version(checkout::cache::kProductList) == 2);
  assert(cache.Version(checkout::cache::kBrandList) == 1);
  assert(cache.Version(checkout::cache::kCategoryList) == 0);
}

void TestInvalidationFailureDoesNotFailCheckout() {
  checkout::testing::CheckoutFixture f;
  auto failing = std::make_shared<FailingInvalidator>();
  auto orchestrator =
      std::make_shared<checkout::core::CheckoutOrchestrator>(f.repository, f.locks, f.stock_ledger, f.cancellations, failing);

  const auto sku    = f.AddSku(f.AddProduct("Lamp"), 1, 10, 3);
  const auto result = orchestrator->Checkout(5, {f.Group(1, {f.AddCartItem(5, sku, 1)})});

  assert(result.payment_id > 0);
  assert(failing->attempts == 1);
  assert(f.Sku(sku).stock == 2);
}

void TestLogNotifierDeliversInOrder() {
  checkout::notify::LogNotifier notifier;
  for (int i = 0; i < 10; ++i) {
    notifier.NotifyUser(i, "payment", R"({"status":"success"})");
  }
  notifier.Flush();
  assert(notifier.Delivered() == 10);
}

void TestBuyerIsNotifiedOnlyWhenSettlementApplies() {
  checkout::testing::CheckoutFixture f;
  auto notifier = std::make_shared<RecordingNotifier>();

  checkout::service::ServiceContext ctx;
  ctx.orchestrator = f.orchestrator;
  ctx.settlement   = f.settlement;
  ctx.notifier     = notifier;
  ctx.repository   = f.repository;
  checkout::service::PaymentService payments(ctx);

  const auto sku    = f.AddSku(f.AddProduct("Lamp"), 1, 40, 3);
  const auto result = f.orchestrator->Checkout(5, {f.Group(1, {f.AddCartItem(5, sku, 2)})});

  checkout::manager::v1::PaymentWebhook webhook;
  webhook.set_id("txn-a");
  webhook.set_gateway("MBBank");
  webhook.set_code("DH" + std::to_string(result.payment_id));
  webhook.set_transfer_type("in");
  webhook.set_transfer_amount(80);

  const auto resp = payments.ReceiveWebhook(webhook);
  assert(!resp.message().empty());
  assert(notifier->sent.size() == 1);
  assert(notifier->sent[0].user_id == 5);
  assert(notifier->sent[0].event == "payment");

  // a second transfer for the settled payment is recorded without a notification
  webhook.set_id("txn-b");
  payments.ReceiveWebhook(webhook);
  assert(notifier->sent.size() == 1);
}

} // namespace

int main() {
  TestVersionKeysPerDomain();
  TestInvalidateBumpsOnlyItsDomain();
  TestInvalidationFailureDoesNotFailCheckout();
  TestLogNotifierDeliversInOrder();
  TestBuyerIsNotifiedOnlyWhenSettlementApplies();

  std::cout << "checkout_manager_unit_cache_notifier: pass\n";
  return 0;
}
