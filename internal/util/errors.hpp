#pragma once

#include <stdexcept>
#include <string>

namespace checkout::util {

/*
  Central error types.

  Grouped by category so the transport edge can map a whole family to one
  status code. These get translated later to gRPC status codes.
*/

// Competing writer or lease holder; the caller may retry after re-reading.
class ContentionError : public std::runtime_error {
 public:
  explicit ContentionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request rejected before anything was committed.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Contention
// ---------------------------------------------------------------------

class LockUnavailable : public ContentionError {
 public:
  explicit LockUnavailable(const std::string& msg) : ContentionError(msg) {
  }
};

class VersionConflict : public ContentionError {
 public:
  explicit VersionConflict(const std::string& msg) : ContentionError(msg) {
  }
};

// ---------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------

class InvalidArgument : public ValidationError {
 public:
  explicit InvalidArgument(const std::string& msg) : ValidationError(msg) {
  }
};

class CartItemNotFound : public ValidationError {
 public:
  explicit CartItemNotFound(const std::string& msg) : ValidationError(msg) {
  }
};

class OutOfStock : public ValidationError {
 public:
  explicit OutOfStock(const std::string& msg) : ValidationError(msg) {
  }
};

class ProductUnavailable : public ValidationError {
 public:
  explicit ProductUnavailable(const std::string& msg) : ValidationError(msg) {
  }
};

class SellerMismatch : public ValidationError {
 public:
  explicit SellerMismatch(const std::string& msg) : ValidationError(msg) {
  }
};

class AmountMismatch : public ValidationError {
 public:
  explicit AmountMismatch(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidPaymentReference : public ValidationError {
 public:
  explicit InvalidPaymentReference(const std::string& msg) : ValidationError(msg) {
  }
};

// ---------------------------------------------------------------------
// Idempotency
// ---------------------------------------------------------------------

class DuplicateTransaction : public std::runtime_error {
 public:
  explicit DuplicateTransaction(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Not found / state
// ---------------------------------------------------------------------

class PaymentNotFound : public NotFound {
 public:
  explicit PaymentNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class OrderNotFound : public NotFound {
 public:
  explicit OrderNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class CannotCancel : public InvalidState {
 public:
  explicit CannotCancel(const std::string& msg) : InvalidState(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace checkout::util
