#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/catalog_record.hpp"
#include "internal/model/state_machine.hpp"

namespace checkout::db::model {

struct ReceiverRecord {
  std::string name;
  std::string phone;
  std::string address;
};

/*
  What was sold, copied by value at order creation.

  Never re-derived from the live SKU/product; later catalog edits do not
  reach existing orders.
*/
struct ProductSnapshot {
  std::string                    product_name;
  int64_t                        sku_price = 0;
  std::string                    image;
  std::string                    sku_value;
  int32_t                        quantity = 0;
  std::vector<TranslationRecord> translations;
};

struct OrderItemRecord {
  int64_t id       = 0;
  int64_t order_id = 0;

  // Cleared when the catalog row is removed; the snapshot survives.
  std::optional<int64_t> sku_id;
  std::optional<int64_t> product_id;

  ProductSnapshot snapshot;

  uint64_t created_at_ms = 0;
};

struct OrderRecord {
  int64_t id         = 0;
  int64_t user_id    = 0;
  int64_t shop_id    = 0;
  int64_t payment_id = 0;

  checkout::model::OrderStatus status = checkout::model::OrderStatus::kUnspecified;
  ReceiverRecord               receiver;

  std::vector<OrderItemRecord> items;

  int64_t                created_by = 0;
  std::optional<int64_t> updated_by;
  uint64_t               created_at_ms = 0;
  uint64_t               updated_at_ms = 0;
  std::optional<uint64_t> deleted_at_ms;
};

struct OrderFilter {
  int64_t                                     user_id = 0;
  std::optional<checkout::model::OrderStatus> status;
  std::size_t                                 limit  = 10;
  std::size_t                                 offset = 0;
};

} // namespace checkout::db::model
