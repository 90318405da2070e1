#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "checkout/manager/v1.hpp"
#include "internal/service/checkout_service.hpp"

namespace checkout::grpc {

class CheckoutServer final : public checkout::manager::v1::CheckoutService::Service {
 public:
  explicit CheckoutServer(std::shared_ptr<checkout::service::CheckoutService> svc);

  ::grpc::Status Checkout(::grpc::ServerContext*, const checkout::manager::v1::CheckoutRequest*,
                          checkout::manager::v1::CheckoutResponse*) override;

  ::grpc::Status GetOrder(::grpc::ServerContext*, const checkout::manager::v1::GetOrderRequest*,
                          checkout::manager::v1::GetOrderResponse*) override;

  ::grpc::Status ListOrders(::grpc::ServerContext*, const checkout::manager::v1::ListOrdersRequest*,
                            checkout::manager::v1::ListOrdersResponse*) override;

  ::grpc::Status CancelOrder(::grpc::ServerContext*, const checkout::manager::v1::CancelOrderRequest*,
                             checkout::manager::v1::CancelOrderResponse*) override;

 private:
  std::shared_ptr<checkout::service::CheckoutService> service_;
};

} // namespace checkout::grpc
