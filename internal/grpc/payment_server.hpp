#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "checkout/manager/v1.hpp"
#include "internal/service/payment_service.hpp"

namespace checkout::grpc {

/*
  Webhook endpoint. Every call must carry metadata
  "authorization: <api key>"; the value is compared by exact match.
*/
class PaymentServer final : public checkout::manager::v1::PaymentWebhookService::Service {
 public:
  PaymentServer(std::shared_ptr<checkout::service::PaymentService> svc, std::string api_key);

  ::grpc::Status ReceiveWebhook(::grpc::ServerContext* ctx, const checkout::manager::v1::PaymentWebhook* req,
                                checkout::manager::v1::PaymentWebhookResponse* resp) override;

  // Throws Unauthenticated unless presented equals the configured key.
  void Authorize(const std::string& presented) const;

 private:
  std::shared_ptr<checkout::service::PaymentService> service_;
  std::string                                        api_key_;
};

} // namespace checkout::grpc
