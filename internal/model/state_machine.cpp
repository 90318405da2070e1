#include "internal/model/state_machine.hpp"

namespace checkout::model {

std::string_view ToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::kPendingPayment:
      return "PENDING_PAYMENT";
    case OrderStatus::kPendingPickup:
      return "PENDING_PICKUP";
    case OrderStatus::kPendingDelivery:
      return "PENDING_DELIVERY";
    case OrderStatus::kDelivered:
      return "DELIVERED";
    case OrderStatus::kReturned:
      return "RETURNED";
    case OrderStatus::kCancelled:
      return "CANCELLED";
    case OrderStatus::kUnspecified:
    default:
      return "UNSPECIFIED";
  }
}

std::string_view ToString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kPending:
      return "PENDING";
    case PaymentStatus::kSuccess:
      return "SUCCESS";
    case PaymentStatus::kFailed:
      return "FAILED";
    case PaymentStatus::kUnspecified:
    default:
      return "UNSPECIFIED";
  }
}

std::optional<OrderStatus> ParseOrderStatus(std::string_view value) {
  for (auto status : {OrderStatus::kPendingPayment, OrderStatus::kPendingPickup, OrderStatus::kPendingDelivery, OrderStatus::kDelivered,
                      OrderStatus::kReturned, OrderStatus::kCancelled}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<PaymentStatus> ParsePaymentStatus(std::string_view value) {
  for (auto status : {PaymentStatus::kPending, PaymentStatus::kSuccess, PaymentStatus::kFailed}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

}  // namespace checkout::model
