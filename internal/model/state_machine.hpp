#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace checkout::model {

enum class OrderStatus : std::uint8_t {
  kUnspecified     = 0,
  kPendingPayment  = 1,
  kPendingPickup   = 2,
  kPendingDelivery = 3,
  kDelivered       = 4,
  kReturned        = 5,
  kCancelled       = 6,
};

enum class PaymentStatus : std::uint8_t {
  kUnspecified = 0,
  kPending     = 1,
  kSuccess     = 2,
  kFailed      = 3,
};

constexpr bool IsTerminal(PaymentStatus status) {
  return status == PaymentStatus::kSuccess || status == PaymentStatus::kFailed;
}

// PENDING -> {SUCCESS, FAILED}; nothing leaves a terminal state.
constexpr bool CanTransition(PaymentStatus from, PaymentStatus to) {
  return from == PaymentStatus::kPending && IsTerminal(to);
}

// Checkout only moves PENDING_PAYMENT -> {PENDING_PICKUP, CANCELLED}.
// Fulfillment states are written by other services and never left here.
constexpr bool CanTransition(OrderStatus from, OrderStatus to) {
  return from == OrderStatus::kPendingPayment && (to == OrderStatus::kPendingPickup || to == OrderStatus::kCancelled);
}

std::string_view ToString(OrderStatus status);
std::string_view ToString(PaymentStatus status);

std::optional<OrderStatus>   ParseOrderStatus(std::string_view value);
std::optional<PaymentStatus> ParsePaymentStatus(std::string_view value);

}  // namespace checkout::model
