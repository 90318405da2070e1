#include "pg_repository.hpp"

#include <map>

#include "internal/db/common/translation_json.hpp"
#include "internal/util/time.hpp"

namespace checkout::db::postgres {

using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

std::string StatusText(OrderStatus s) {
  return std::string(checkout::model::ToString(s));
}

std::string StatusText(PaymentStatus s) {
  return std::string(checkout::model::ToString(s));
}

template <typename T>
std::optional<T> Opt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

// explicit ids (catalog seeding) must not collide with later BIGSERIAL values
void SyncSequence(pqxx::work& w, const std::string& table) {
  w.exec("SELECT setval(pg_get_serial_sequence('" + table + "','id'), GREATEST((SELECT MAX(id) FROM " + table + "), 1));");
}

constexpr const char* kOrderColumns =
    "id,user_id,shop_id,payment_id,status,receiver_name,receiver_phone,receiver_address,created_by,updated_by,created_at_ms,"
    "updated_at_ms,deleted_at_ms";

model::OrderRecord ReadOrder(const pqxx::row& row) {
  model::OrderRecord r;
  r.id               = row[0].as<int64_t>();
  r.user_id          = row[1].as<int64_t>();
  r.shop_id          = row[2].as<int64_t>();
  r.payment_id       = row[3].as<int64_t>();
  r.status           = checkout::model::ParseOrderStatus(row[4].c_str()).value_or(OrderStatus::kUnspecified);
  r.receiver.name    = row[5].c_str();
  r.receiver.phone   = row[6].c_str();
  r.receiver.address = row[7].c_str();
  r.created_by       = row[8].as<int64_t>();
  r.updated_by       = Opt<int64_t>(row[9]);
  r.created_at_ms    = row[10].as<uint64_t>();
  r.updated_at_ms    = row[11].as<uint64_t>();
  r.deleted_at_ms    = Opt<uint64_t>(row[12]);
  return r;
}

model::SkuRecord ReadSku(const pqxx::row& row, int base) {
  model::SkuRecord r;
  r.id            = row[base + 0].as<int64_t>();
  r.product_id    = row[base + 1].as<int64_t>();
  r.created_by    = row[base + 2].as<int64_t>();
  r.value         = row[base + 3].c_str();
  r.price         = row[base + 4].as<int64_t>();
  r.image         = row[base + 5].c_str();
  r.stock         = row[base + 6].as<int64_t>();
  r.version       = row[base + 7].as<uint64_t>();
  r.deleted_at_ms = Opt<uint64_t>(row[base + 8]);
  return r;
}

model::DelayedJobRecord ReadJob(const pqxx::row& row) {
  return model::DelayedJobRecord{row[0].c_str(), row[1].c_str(), row[2].c_str(), row[3].as<uint64_t>(), row[4].as<uint32_t>(),
                                 row[5].as<uint64_t>()};
}

std::string IdArray(const std::vector<int64_t>& ids) {
  std::string out = "{";
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(ids[i]);
  }
  return out + "}";
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::vector<model::TranslationRecord> PgRepository::LoadTranslations(pqxx::work& w, int64_t product_id) {
  auto res = w.exec_params("SELECT id,language_id,name,description FROM product_translation WHERE product_id=$1 ORDER BY id;",
                           product_id);

  std::vector<model::TranslationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(model::TranslationRecord{row[0].as<int64_t>(), row[1].c_str(), row[2].c_str(), row[3].c_str()});
  }
  return out;
}

std::vector<model::OrderItemRecord> PgRepository::LoadItems(pqxx::work& w, int64_t order_id) {
  auto res = w.exec_params(
      "SELECT id,order_id,sku_id,product_id,product_name,sku_price,image,sku_value,quantity,product_translations::text,"
      "created_at_ms FROM order_item WHERE order_id=$1 ORDER BY id;",
      order_id);

  std::vector<model::OrderItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::OrderItemRecord r;
    r.id                    = row[0].as<int64_t>();
    r.order_id              = row[1].as<int64_t>();
    r.sku_id                = Opt<int64_t>(row[2]);
    r.product_id            = Opt<int64_t>(row[3]);
    r.snapshot.product_name = row[4].c_str();
    r.snapshot.sku_price    = row[5].as<int64_t>();
    r.snapshot.image        = row[6].c_str();
    r.snapshot.sku_value    = row[7].c_str();
    r.snapshot.quantity     = row[8].as<int32_t>();
    r.snapshot.translations = DecodeTranslations(row[9].c_str());
    r.created_at_ms         = row[10].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::InsertProduct(Transaction& t, model::ProductRecord& r) {
  auto& w = TX(t).Work();
  try {
    if (r.id == 0) {
      auto res = w.exec_params("INSERT INTO product(name,published_at_ms,deleted_at_ms) VALUES($1,$2,$3) RETURNING id;", r.name,
                               r.published_at_ms, r.deleted_at_ms);
      r.id     = res[0][0].as<int64_t>();
    } else {
      w.exec_params("INSERT INTO product(id,name,published_at_ms,deleted_at_ms) VALUES($1,$2,$3,$4);", r.id, r.name,
                    r.published_at_ms, r.deleted_at_ms);
      SyncSequence(w, "product");
    }

    for (auto& tr : r.translations) {
      auto res = w.exec_params(
          "INSERT INTO product_translation(product_id,language_id,name,description) VALUES($1,$2,$3,$4) RETURNING id;", r.id,
          tr.language_id, tr.name, tr.description);
      tr.id = res[0][0].as<int64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSku(Transaction& t, model::SkuRecord& r) {
  auto& w = TX(t).Work();
  try {
    if (r.id == 0) {
      auto res = w.exec_params(
          "INSERT INTO sku(product_id,created_by,value,price,image,stock,version,deleted_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
          "RETURNING id;",
          r.product_id, r.created_by, r.value, r.price, r.image, r.stock, static_cast<int64_t>(r.version), r.deleted_at_ms);
      r.id = res[0][0].as<int64_t>();
    } else {
      w.exec_params(
          "INSERT INTO sku(id,product_id,created_by,value,price,image,stock,version,deleted_at_ms) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
          r.id, r.product_id, r.created_by, r.value, r.price, r.image, r.stock, static_cast<int64_t>(r.version), r.deleted_at_ms);
      SyncSequence(w, "sku");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SkuRecord> PgRepository::GetSku(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_sku", id);
  if (res.empty()) return std::nullopt;
  return ReadSku(res[0], 0);
}

Result PgRepository::UpdateSku(Transaction& t, const model::SkuRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE sku SET product_id=$1,created_by=$2,value=$3,price=$4,image=$5,stock=$6,deleted_at_ms=$7,version=version+1 "
        "WHERE id=$8;",
        r.product_id, r.created_by, r.value, r.price, r.image, r.stock, r.deleted_at_ms, r.id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSku(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM sku WHERE id=$1;", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cart
// ------------------------------------------------------------------

Result PgRepository::InsertCartItem(Transaction& t, model::CartItemRecord& r) {
  auto& w = TX(t).Work();
  try {
    if (r.id == 0) {
      auto res = w.exec_params("INSERT INTO cart_item(user_id,sku_id,quantity) VALUES($1,$2,$3) RETURNING id;", r.user_id, r.sku_id,
                               r.quantity);
      r.id     = res[0][0].as<int64_t>();
    } else {
      w.exec_params("INSERT INTO cart_item(id,user_id,sku_id,quantity) VALUES($1,$2,$3,$4);", r.id, r.user_id, r.sku_id, r.quantity);
      SyncSequence(w, "cart_item");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CartLine> PgRepository::GetCartLines(Transaction& t, int64_t user_id, const std::vector<int64_t>& ids) {
  if (ids.empty()) return {};
  auto& w = TX(t).Work();

  auto res = w.exec_params(
      "SELECT c.id,c.user_id,c.sku_id,c.quantity,"
      "s.id,s.product_id,s.created_by,s.value,s.price,s.image,s.stock,s.version,s.deleted_at_ms,"
      "p.id,p.name,p.published_at_ms,p.deleted_at_ms "
      "FROM cart_item c JOIN sku s ON s.id=c.sku_id JOIN product p ON p.id=s.product_id "
      "WHERE c.user_id=$1 AND c.id = ANY($2::bigint[]) ORDER BY c.id;",
      user_id, IdArray(ids));

  std::vector<model::CartLine>                             lines;
  std::map<int64_t, std::vector<model::TranslationRecord>> translations;
  for (const auto& row : res) {
    model::CartLine line;
    line.item.id                 = row[0].as<int64_t>();
    line.item.user_id            = row[1].as<int64_t>();
    line.item.sku_id             = row[2].as<int64_t>();
    line.item.quantity           = row[3].as<int32_t>();
    line.sku                     = ReadSku(row, 4);
    line.product.id              = row[13].as<int64_t>();
    line.product.name            = row[14].c_str();
    line.product.published_at_ms = Opt<uint64_t>(row[15]);
    line.product.deleted_at_ms   = Opt<uint64_t>(row[16]);
    lines.push_back(std::move(line));
  }

  for (auto& line : lines) {
    auto it = translations.find(line.product.id);
    if (it == translations.end()) {
      it = translations.emplace(line.product.id, LoadTranslations(w, line.product.id)).first;
    }
    line.product.translations = it->second;
  }
  return lines;
}

Result PgRepository::DeleteCartItems(Transaction& t, const std::vector<int64_t>& ids) {
  if (ids.empty()) return Result::Ok();
  try {
    TX(t).Work().exec_params("DELETE FROM cart_item WHERE id = ANY($1::bigint[]);", IdArray(ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Stock
// ------------------------------------------------------------------

Result PgRepository::DecrementStock(Transaction& t, int64_t sku_id, int64_t quantity, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("decrement_stock", quantity, sku_id, static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::Conflict, "stock guard failed for sku " + std::to_string(sku_id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementStock(Transaction& t, int64_t sku_id, int64_t quantity) {
  try {
    auto res = TX(t).Work().exec_prepared("increment_stock", quantity, sku_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result PgRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;
  try {
    auto res = TX(t).Work().exec_params("INSERT INTO payment(status,created_at_ms,updated_at_ms) VALUES($1,$2,$3) RETURNING id;",
                                        StatusText(r.status), r.created_at_ms, r.updated_at_ms);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPayment(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_payment", id);
  if (res.empty()) return std::nullopt;

  model::PaymentRecord r;
  r.id            = res[0][0].as<int64_t>();
  r.status        = checkout::model::ParsePaymentStatus(res[0][1].c_str()).value_or(PaymentStatus::kUnspecified);
  r.created_at_ms = res[0][2].as<uint64_t>();
  r.updated_at_ms = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::UpdatePaymentStatus(Transaction& t, int64_t id, PaymentStatus from, PaymentStatus to) {
  try {
    auto res = TX(t).Work().exec_prepared("update_payment_status", StatusText(to), NowMs(), id, StatusText(from));
    if (res.affected_rows() == 0) {
      if (!GetPayment(t, id)) return Result::Err(ErrorCode::NotFound);
      return Result::Err(ErrorCode::Conflict, "payment status changed");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertPaymentTransaction(Transaction& t, const model::PaymentTransactionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO payment_transaction(id,gateway,transaction_date,account_number,code,content,amount_in,amount_out,"
        "accumulated,sub_account,reference_code,description,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13);",
        r.id, r.gateway, r.transaction_date, r.account_number, r.code, r.content, r.amount_in, r.amount_out, r.accumulated,
        r.sub_account, r.reference_code, r.description, r.created_at_ms == 0 ? NowMs() : r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentTransactionRecord> PgRepository::GetPaymentTransaction(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,gateway,transaction_date,account_number,code,content,amount_in,amount_out,accumulated,sub_account,"
      "reference_code,description,created_at_ms FROM payment_transaction WHERE id=$1;",
      id);
  if (res.empty()) return std::nullopt;

  const auto&                     row = res[0];
  model::PaymentTransactionRecord r;
  r.id               = row[0].c_str();
  r.gateway          = row[1].c_str();
  r.transaction_date = row[2].c_str();
  r.account_number   = row[3].c_str();
  r.code             = Opt<std::string>(row[4]);
  r.content          = Opt<std::string>(row[5]);
  r.amount_in        = row[6].as<int64_t>();
  r.amount_out       = row[7].as<int64_t>();
  r.accumulated      = row[8].as<int64_t>();
  r.sub_account      = row[9].c_str();
  r.reference_code   = row[10].c_str();
  r.description      = row[11].c_str();
  r.created_at_ms    = row[12].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result PgRepository::InsertOrder(Transaction& t, model::OrderRecord& r) {
  auto& w = TX(t).Work();
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;

  try {
    auto res = w.exec_params(
        "INSERT INTO orders(user_id,shop_id,payment_id,status,receiver_name,receiver_phone,receiver_address,created_by,updated_by,"
        "created_at_ms,updated_at_ms,deleted_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) RETURNING id;",
        r.user_id, r.shop_id, r.payment_id, StatusText(r.status), r.receiver.name, r.receiver.phone, r.receiver.address,
        r.created_by, r.updated_by, r.created_at_ms, r.updated_at_ms, r.deleted_at_ms);
    r.id = res[0][0].as<int64_t>();

    for (auto& item : r.items) {
      if (item.created_at_ms == 0) item.created_at_ms = r.created_at_ms;
      auto item_res = w.exec_params(
          "INSERT INTO order_item(order_id,sku_id,product_id,product_name,sku_price,image,sku_value,quantity,"
          "product_translations,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9::jsonb,$10) RETURNING id;",
          r.id, item.sku_id, item.product_id, item.snapshot.product_name, item.snapshot.sku_price, item.snapshot.image,
          item.snapshot.sku_value, item.snapshot.quantity, EncodeTranslations(item.snapshot.translations), item.created_at_ms);
      item.id       = item_res[0][0].as<int64_t>();
      item.order_id = r.id;
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OrderRecord> PgRepository::GetOrder(Transaction& t, int64_t id) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_params(std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  auto order  = ReadOrder(res[0]);
  order.items = LoadItems(w, order.id);
  return order;
}

std::vector<model::OrderRecord> PgRepository::ListOrdersByPayment(Transaction& t, int64_t payment_id) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_params(std::string("SELECT ") + kOrderColumns + " FROM orders WHERE payment_id=$1 ORDER BY id;", payment_id);

  std::vector<model::OrderRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadOrder(row));
  for (auto& order : out) order.items = LoadItems(w, order.id);
  return out;
}

std::vector<model::OrderRecord> PgRepository::ListOrders(Transaction& t, const model::OrderFilter& f) {
  auto&                      w = TX(t).Work();
  std::optional<std::string> status;
  if (f.status) status = StatusText(*f.status);

  auto res = w.exec_params(std::string("SELECT ") + kOrderColumns +
                               " FROM orders WHERE user_id=$1 AND deleted_at_ms IS NULL AND ($2::text IS NULL OR status=$2) "
                               "ORDER BY created_at_ms DESC, id DESC LIMIT $3 OFFSET $4;",
                           f.user_id, status, static_cast<int64_t>(f.limit), static_cast<int64_t>(f.offset));

  std::vector<model::OrderRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadOrder(row));
  for (auto& order : out) order.items = LoadItems(w, order.id);
  return out;
}

uint64_t PgRepository::CountOrders(Transaction& t, const model::OrderFilter& f) {
  std::optional<std::string> status;
  if (f.status) status = StatusText(*f.status);

  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*) FROM orders WHERE user_id=$1 AND deleted_at_ms IS NULL AND ($2::text IS NULL OR status=$2);", f.user_id,
      status);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::UpdateOrderStatus(Transaction& t, int64_t id, OrderStatus from, OrderStatus to,
                                       std::optional<int64_t> updated_by) {
  try {
    auto res = TX(t).Work().exec_prepared("update_order_status", StatusText(to), NowMs(), updated_by, id, StatusText(from));
    if (res.affected_rows() == 0) {
      if (!GetOrder(t, id)) return Result::Err(ErrorCode::NotFound);
      return Result::Err(ErrorCode::Conflict, "order status changed");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Delayed jobs
// ------------------------------------------------------------------

Result PgRepository::UpsertDelayedJob(Transaction& t, const model::DelayedJobRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO delayed_job(id,type,payload,run_at_ms,attempts,created_at_ms) VALUES($1,$2,$3::jsonb,$4,$5,$6) "
        "ON CONFLICT(id) DO UPDATE SET type=EXCLUDED.type, payload=EXCLUDED.payload, run_at_ms=EXCLUDED.run_at_ms, "
        "attempts=EXCLUDED.attempts;",
        r.id, r.type, r.payload, r.run_at_ms, r.attempts, r.created_at_ms == 0 ? NowMs() : r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDelayedJob(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM delayed_job WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DelayedJobRecord> PgRepository::GetDelayedJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,type,payload::text,run_at_ms,attempts,created_at_ms FROM delayed_job WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::DelayedJobRecord> PgRepository::ListDueDelayedJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  // SKIP LOCKED lets several workers share the table
  auto res = TX(t).Work().exec_params(
      "SELECT id,type,payload::text,run_at_ms,attempts,created_at_ms FROM delayed_job WHERE run_at_ms<=$1 "
      "ORDER BY run_at_ms, id LIMIT $2 FOR UPDATE SKIP LOCKED;",
      now_ms, static_cast<int64_t>(limit));

  std::vector<model::DelayedJobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row));
  return out;
}

} // namespace checkout::db::postgres
