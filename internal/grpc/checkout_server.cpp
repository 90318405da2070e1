#include "checkout_server.hpp"

#include "grpc_error.hpp"

namespace checkout::grpc {

using namespace checkout::manager::v1;

CheckoutServer::CheckoutServer(std::shared_ptr<checkout::service::CheckoutService> svc) : service_(std::move(svc)) {
}

::grpc::Status CheckoutServer::Checkout(::grpc::ServerContext*, const CheckoutRequest* req, CheckoutResponse* resp) {
  try {
    *resp = service_->Checkout(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CheckoutServer::GetOrder(::grpc::ServerContext*, const GetOrderRequest* req, GetOrderResponse* resp) {
  try {
    *resp = service_->GetOrder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CheckoutServer::ListOrders(::grpc::ServerContext*, const ListOrdersRequest* req, ListOrdersResponse* resp) {
  try {
    *resp = service_->ListOrders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CheckoutServer::CancelOrder(::grpc::ServerContext*, const CancelOrderRequest* req, CancelOrderResponse* resp) {
  try {
    *resp = service_->CancelOrder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace checkout::grpc
