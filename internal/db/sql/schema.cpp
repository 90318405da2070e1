#include "schema.hpp"

namespace checkout::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS product (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, published_at_ms INTEGER, "
      "deleted_at_ms INTEGER);",
      "CREATE TABLE IF NOT EXISTS product_translation (id INTEGER PRIMARY KEY AUTOINCREMENT, product_id INTEGER NOT NULL "
      "REFERENCES product(id) ON DELETE CASCADE, language_id TEXT NOT NULL, name TEXT NOT NULL, description TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sku (id INTEGER PRIMARY KEY AUTOINCREMENT, product_id INTEGER NOT NULL REFERENCES product(id), "
      "created_by INTEGER NOT NULL, value TEXT NOT NULL, price INTEGER NOT NULL, image TEXT NOT NULL, stock INTEGER NOT NULL "
      "CHECK (stock >= 0), version INTEGER NOT NULL DEFAULT 0, deleted_at_ms INTEGER);",
      "CREATE TABLE IF NOT EXISTS cart_item (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id INTEGER NOT NULL, sku_id INTEGER NOT NULL "
      "REFERENCES sku(id) ON DELETE CASCADE, quantity INTEGER NOT NULL CHECK (quantity >= 1));",
      "CREATE INDEX IF NOT EXISTS cart_item_user_idx ON cart_item(user_id);",

      "CREATE TABLE IF NOT EXISTS payment (id INTEGER PRIMARY KEY AUTOINCREMENT, status TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_transaction (id TEXT PRIMARY KEY, gateway TEXT NOT NULL, transaction_date TEXT NOT NULL, "
      "account_number TEXT NOT NULL, code TEXT, content TEXT, amount_in INTEGER NOT NULL, amount_out INTEGER NOT NULL, "
      "accumulated INTEGER NOT NULL, sub_account TEXT NOT NULL, reference_code TEXT NOT NULL, description TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS orders (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id INTEGER NOT NULL, shop_id INTEGER NOT NULL, "
      "payment_id INTEGER NOT NULL REFERENCES payment(id), status TEXT NOT NULL, receiver_name TEXT NOT NULL, receiver_phone TEXT NOT "
      "NULL, receiver_address TEXT NOT NULL, created_by INTEGER NOT NULL, updated_by INTEGER, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS orders_user_idx ON orders(user_id, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS orders_payment_idx ON orders(payment_id);",
      "CREATE TABLE IF NOT EXISTS order_item (id INTEGER PRIMARY KEY AUTOINCREMENT, order_id INTEGER NOT NULL REFERENCES orders(id) "
      "ON DELETE CASCADE, sku_id INTEGER REFERENCES sku(id) ON DELETE SET NULL, product_id INTEGER REFERENCES product(id) ON DELETE "
      "SET NULL, product_name TEXT NOT NULL, sku_price INTEGER NOT NULL, image TEXT NOT NULL, sku_value TEXT NOT NULL, quantity "
      "INTEGER NOT NULL, product_translations TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS order_item_order_idx ON order_item(order_id);",

      "CREATE TABLE IF NOT EXISTS delayed_job (id TEXT PRIMARY KEY, type TEXT NOT NULL, payload TEXT NOT NULL, run_at_ms INTEGER NOT "
      "NULL, attempts INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS delayed_job_due_idx ON delayed_job(run_at_ms);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",

      "CREATE TABLE IF NOT EXISTS product (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, published_at_ms BIGINT, deleted_at_ms BIGINT);",
      "CREATE TABLE IF NOT EXISTS product_translation (id BIGSERIAL PRIMARY KEY, product_id BIGINT NOT NULL REFERENCES product(id) "
      "ON DELETE CASCADE, language_id TEXT NOT NULL, name TEXT NOT NULL, description TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sku (id BIGSERIAL PRIMARY KEY, product_id BIGINT NOT NULL REFERENCES product(id), created_by BIGINT "
      "NOT NULL, value TEXT NOT NULL, price BIGINT NOT NULL, image TEXT NOT NULL, stock BIGINT NOT NULL CHECK (stock >= 0), version "
      "BIGINT NOT NULL DEFAULT 0, deleted_at_ms BIGINT);",
      "CREATE TABLE IF NOT EXISTS cart_item (id BIGSERIAL PRIMARY KEY, user_id BIGINT NOT NULL, sku_id BIGINT NOT NULL REFERENCES "
      "sku(id) ON DELETE CASCADE, quantity INTEGER NOT NULL CHECK (quantity >= 1));",
      "CREATE INDEX IF NOT EXISTS cart_item_user_idx ON cart_item(user_id);",

      "CREATE TABLE IF NOT EXISTS payment (id BIGSERIAL PRIMARY KEY, status TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_transaction (id TEXT PRIMARY KEY, gateway TEXT NOT NULL, transaction_date TEXT NOT NULL, "
      "account_number TEXT NOT NULL, code TEXT, content TEXT, amount_in BIGINT NOT NULL, amount_out BIGINT NOT NULL, accumulated "
      "BIGINT NOT NULL, sub_account TEXT NOT NULL, reference_code TEXT NOT NULL, description TEXT NOT NULL, created_at_ms BIGINT NOT "
      "NULL);",

      "CREATE TABLE IF NOT EXISTS orders (id BIGSERIAL PRIMARY KEY, user_id BIGINT NOT NULL, shop_id BIGINT NOT NULL, payment_id "
      "BIGINT NOT NULL REFERENCES payment(id), status TEXT NOT NULL, receiver_name TEXT NOT NULL, receiver_phone TEXT NOT NULL, "
      "receiver_address TEXT NOT NULL, created_by BIGINT NOT NULL, updated_by BIGINT, created_at_ms BIGINT NOT NULL, updated_at_ms "
      "BIGINT NOT NULL, deleted_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS orders_user_idx ON orders(user_id, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS orders_payment_idx ON orders(payment_id);",
      "CREATE TABLE IF NOT EXISTS order_item (id BIGSERIAL PRIMARY KEY, order_id BIGINT NOT NULL REFERENCES orders(id) ON DELETE "
      "CASCADE, sku_id BIGINT REFERENCES sku(id) ON DELETE SET NULL, product_id BIGINT REFERENCES product(id) ON DELETE SET NULL, "
      "product_name TEXT NOT NULL, sku_price BIGINT NOT NULL, image TEXT NOT NULL, sku_value TEXT NOT NULL, quantity INTEGER NOT "
      "NULL, product_translations JSONB NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS order_item_order_idx ON order_item(order_id);",

      "CREATE TABLE IF NOT EXISTS delayed_job (id TEXT PRIMARY KEY, type TEXT NOT NULL, payload JSONB NOT NULL, run_at_ms BIGINT NOT "
      "NULL, attempts INTEGER NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS delayed_job_due_idx ON delayed_job(run_at_ms);"};
  return kSchema;
}

} // namespace checkout::db::sql
