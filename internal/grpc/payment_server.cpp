#include "payment_server.hpp"

#include "grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace checkout::grpc {

using namespace checkout::manager::v1;

namespace {

constexpr const char* kAuthorizationHeader = "authorization";

} // namespace

PaymentServer::PaymentServer(std::shared_ptr<checkout::service::PaymentService> svc, std::string api_key)
    : service_(std::move(svc)), api_key_(std::move(api_key)) {
}

void PaymentServer::Authorize(const std::string& presented) const {
  // An unset key rejects everything rather than accepting an empty header.
  if (api_key_.empty() || presented != api_key_) {
    throw util::Unauthenticated("invalid payment api key");
  }
}

::grpc::Status PaymentServer::ReceiveWebhook(::grpc::ServerContext* ctx, const PaymentWebhook* req, PaymentWebhookResponse* resp) {
  try {
    std::string presented;
    if (ctx) {
      const auto& metadata = ctx->client_metadata();
      const auto  it       = metadata.find(kAuthorizationHeader);
      if (it != metadata.end()) {
        presented.assign(it->second.data(), it->second.size());
      }
    }
    Authorize(presented);

    *resp = service_->ReceiveWebhook(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace checkout::grpc
