#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/checkout_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/payment_server.hpp"
#include "internal/service/checkout_service.hpp"
#include "internal/service/payment_service.hpp"
#include "tests/support/checkout_fixture.hpp"

namespace {

using checkout::grpc::ToStatus;
using ::grpc::StatusCode;

checkout::service::ServiceContext BuildServiceContext(checkout::testing::CheckoutFixture& f) {
  checkout::service::ServiceContext ctx;
  ctx.orchestrator = f.orchestrator;
  ctx.settlement   = f.settlement;
  ctx.repository   = f.repository;
  return ctx;
}

void TestErrorFamiliesMapToStatusCodes() {
  using namespace checkout::util;

  assert(ToStatus(LockUnavailable("x")).error_code() == StatusCode::ABORTED);
  assert(ToStatus(VersionConflict("x")).error_code() == StatusCode::ABORTED);
  assert(ToStatus(InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(OutOfStock("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(CartItemNotFound("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(AmountMismatch("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(DuplicateTransaction("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(ToStatus(PaymentNotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(OrderNotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(ToStatus(CannotCancel("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(Unauthenticated("x")).error_code() == StatusCode::UNAUTHENTICATED);
  assert(ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);
  assert(ToStatus(OutOfStock("sku 4 has 0 left")).error_message() == "sku 4 has 0 left");
}

void TestCheckoutServerRoundTrip() {
  checkout::testing::CheckoutFixture f;
  const auto sku  = f.AddSku(f.AddProduct("Lamp"), 4, 1500, 2);
  const auto cart = f.AddCartItem(8, sku, 2);

  auto service = std::make_shared<checkout::service::CheckoutService>(BuildServiceContext(f));
  checkout::grpc::CheckoutServer server(service);

  checkout::manager::v1::CheckoutRequest req;
  req.set_user_id(8);
  auto* group = req.add_groups();
  group->set_shop_id(4);
  group->mutable_receiver()->set_name("Tran Thi B");
  group->add_cart_item_ids(cart);

  checkout::manager::v1::CheckoutResponse resp;
  auto status = server.Checkout(nullptr, &req, &resp);
  assert(status.ok());
  assert(resp.payment_id() > 0);
  assert(resp.orders_size() == 1);
  assert(resp.orders(0).status() == checkout::manager::v1::ORDER_STATUS_PENDING_PAYMENT);
  assert(resp.orders(0).items(0).sku_price() == 1500);
  assert(resp.orders(0).items(0).product_translations_size() == 2);

  // same cart items again: already consumed
  checkout::manager::v1::CheckoutResponse again;
  status = server.Checkout(nullptr, &req, &again);
  assert(status.error_code() == StatusCode::FAILED_PRECONDITION);

  checkout::manager::v1::ListOrdersRequest list_req;
  list_req.set_user_id(8);
  checkout::manager::v1::ListOrdersResponse list_resp;
  assert(server.ListOrders(nullptr, &list_req, &list_resp).ok());
  assert(list_resp.total_items() == 1);
  assert(list_resp.page() == 1);
  assert(list_resp.limit() == 10);

  checkout::manager::v1::CancelOrderRequest cancel_req;
  cancel_req.set_user_id(8);
  cancel_req.set_order_id(resp.orders(0).id());
  checkout::manager::v1::CancelOrderResponse cancel_resp;
  assert(server.CancelOrder(nullptr, &cancel_req, &cancel_resp).ok());
  assert(cancel_resp.order().status() == checkout::manager::v1::ORDER_STATUS_CANCELLED);

  checkout::manager::v1::GetOrderRequest get_req;
  get_req.set_user_id(9);
  get_req.set_order_id(resp.orders(0).id());
  checkout::manager::v1::GetOrderResponse get_resp;
  assert(server.GetOrder(nullptr, &get_req, &get_resp).error_code() == StatusCode::NOT_FOUND);

  checkout::manager::v1::CheckoutRequest anonymous;
  assert(server.Checkout(nullptr, &anonymous, &again).error_code() == StatusCode::INVALID_ARGUMENT);
}

void TestPaymentServerRequiresApiKey() {
  checkout::testing::CheckoutFixture f;
  auto service = std::make_shared<checkout::service::PaymentService>(BuildServiceContext(f));

  checkout::grpc::PaymentServer server(service, "secret");
  server.Authorize("secret");

  bool threw = false;
  try {
    server.Authorize("Secret");
  } catch (const checkout::util::Unauthenticated&) {
    threw = true;
  }
  assert(threw);

  checkout::manager::v1::PaymentWebhook         webhook;
  checkout::manager::v1::PaymentWebhookResponse resp;
  assert(server.ReceiveWebhook(nullptr, &webhook, &resp).error_code() == StatusCode::UNAUTHENTICATED);

  checkout::grpc::PaymentServer unconfigured(service, "");
  threw = false;
  try {
    unconfigured.Authorize("");
  } catch (const checkout::util::Unauthenticated&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestErrorFamiliesMapToStatusCodes();
  TestCheckoutServerRoundTrip();
  TestPaymentServerRequiresApiKey();

  std::cout << "checkout_manager_unit_grpc_status: pass\n";
  return 0;
}
