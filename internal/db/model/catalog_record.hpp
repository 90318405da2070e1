#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace checkout::db::model {

/*
  Catalog rows as seen by checkout.

  Catalog CRUD lives in another service; checkout only reads products and
  mutates SKU stock through the ledger.
*/

struct TranslationRecord {
  int64_t     id = 0;
  std::string language_id;
  std::string name;
  std::string description;
};

struct ProductRecord {
  int64_t     id = 0;
  std::string name;

  // Unpublished when unset; scheduled when in the future.
  std::optional<uint64_t> published_at_ms;
  std::optional<uint64_t> deleted_at_ms;

  std::vector<TranslationRecord> translations;
};

struct SkuRecord {
  int64_t     id         = 0;
  int64_t     product_id = 0;
  int64_t     created_by = 0;  // seller owning the SKU
  std::string value;           // variant, e.g. "Red-Large"
  int64_t     price = 0;       // smallest currency unit
  std::string image;
  int64_t     stock = 0;

  // Monotonic optimistic concurrency token; bumped on every stock or
  // catalog write.
  uint64_t version = 0;

  std::optional<uint64_t> deleted_at_ms;
};

struct CartItemRecord {
  int64_t id       = 0;
  int64_t user_id  = 0;
  int64_t sku_id   = 0;
  int32_t quantity = 0;
};

// Cart item joined with its SKU and product, read inside the checkout
// transaction.
struct CartLine {
  CartItemRecord item;
  SkuRecord      sku;
  ProductRecord  product;
};

} // namespace checkout::db::model
