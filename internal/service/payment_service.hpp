#pragma once

#include "checkout/manager/v1.hpp"
#include "service_context.hpp"

namespace checkout::service {

/*
  Gateway webhook intake. Settles the payment, then notifies the buyer
  once the transaction has committed.
*/
class PaymentService {
 public:
  explicit PaymentService(ServiceContext ctx);

  checkout::manager::v1::PaymentWebhookResponse ReceiveWebhook(const checkout::manager::v1::PaymentWebhook& req);

 private:
  ServiceContext ctx_;
};

} // namespace checkout::service
