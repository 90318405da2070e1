#include "payment_service.hpp"

#include "internal/core/settlement.hpp"
#include "internal/notify/notifier.hpp"
#include "observe_rpc.hpp"

namespace checkout::service {

using namespace checkout::manager::v1;

namespace {

constexpr const char* kPaymentEvent         = "payment";
constexpr const char* kPaymentSettledPayload = R"({"status":"success"})";

core::Webhook FromProto(const PaymentWebhook& req) {
  core::Webhook webhook;
  webhook.id               = req.id();
  webhook.gateway          = req.gateway();
  webhook.transaction_date = req.transaction_date();
  webhook.account_number   = req.account_number();
  if (req.has_code()) webhook.code = req.code();
  if (req.has_content()) webhook.content = req.content();
  webhook.transfer_type   = req.transfer_type();
  webhook.transfer_amount = req.transfer_amount();
  webhook.accumulated     = req.accumulated();
  webhook.sub_account     = req.sub_account();
  webhook.reference_code  = req.reference_code();
  webhook.description     = req.description();
  return webhook;
}

} // namespace

PaymentService::PaymentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PaymentWebhookResponse PaymentService::ReceiveWebhook(const PaymentWebhook& req) {
  return ObserveRpc("PaymentWebhookService.ReceiveWebhook", [&] {
    const auto result = ctx_.settlement->Settle(FromProto(req));

    if (result.applied && ctx_.notifier) {
      ctx_.notifier->NotifyUser(result.buyer_id, kPaymentEvent, kPaymentSettledPayload);
    }

    PaymentWebhookResponse resp;
    resp.set_message(result.applied ? "Payment successful" : "Payment already settled");
    return resp;
  });
}

} // namespace checkout::service
