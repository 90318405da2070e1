#pragma once

#include "checkout/manager/v1.hpp"
#include "service_context.hpp"

namespace checkout::service {

class CheckoutService {
 public:
  explicit CheckoutService(ServiceContext ctx);

  checkout::manager::v1::CheckoutResponse Checkout(const checkout::manager::v1::CheckoutRequest& req);

  checkout::manager::v1::GetOrderResponse GetOrder(const checkout::manager::v1::GetOrderRequest& req);

  checkout::manager::v1::ListOrdersResponse ListOrders(const checkout::manager::v1::ListOrdersRequest& req);

  checkout::manager::v1::CancelOrderResponse CancelOrder(const checkout::manager::v1::CancelOrderRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace checkout::service
