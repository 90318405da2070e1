#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <map>
#include <stdexcept>
#include <type_traits>

#include "internal/db/common/translation_json.hpp"
#include "internal/util/time.hpp"

namespace checkout::db::sqlite {

using checkout::db::ErrorCode;
using checkout::db::Result;
using checkout::model::OrderStatus;
using checkout::model::PaymentStatus;

namespace {

// Finalizes on scope exit; prepare failures are programming errors.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  void Reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOpt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (!v) {
    sqlite3_bind_null(st, idx);
  } else if constexpr (std::is_same_v<T, std::string>) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  }
}

// id 0 means "let sqlite assign one"
void BindId(sqlite3_stmt* st, int idx, int64_t id) {
  if (id == 0)
    sqlite3_bind_null(st, idx);
  else
    BindI64(st, idx, id);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::string StatusText(OrderStatus s) {
  return std::string(checkout::model::ToString(s));
}

std::string StatusText(PaymentStatus s) {
  return std::string(checkout::model::ToString(s));
}

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

constexpr const char* kOrderColumns =
    "id,user_id,shop_id,payment_id,status,receiver_name,receiver_phone,receiver_address,created_by,updated_by,created_at_ms,"
    "updated_at_ms,deleted_at_ms";

model::OrderRecord ReadOrder(sqlite3_stmt* st) {
  model::OrderRecord r;
  r.id               = ColI64(st, 0);
  r.user_id          = ColI64(st, 1);
  r.shop_id          = ColI64(st, 2);
  r.payment_id       = ColI64(st, 3);
  r.status           = checkout::model::ParseOrderStatus(ColText(st, 4)).value_or(OrderStatus::kUnspecified);
  r.receiver.name    = ColText(st, 5);
  r.receiver.phone   = ColText(st, 6);
  r.receiver.address = ColText(st, 7);
  r.created_by       = ColI64(st, 8);
  r.updated_by       = ColOptI64(st, 9);
  r.created_at_ms    = ColU64(st, 10);
  r.updated_at_ms    = ColU64(st, 11);
  r.deleted_at_ms    = ColOptU64(st, 12);
  return r;
}

model::SkuRecord ReadSku(sqlite3_stmt* st, int base) {
  model::SkuRecord r;
  r.id            = ColI64(st, base + 0);
  r.product_id    = ColI64(st, base + 1);
  r.created_by    = ColI64(st, base + 2);
  r.value         = ColText(st, base + 3);
  r.price         = ColI64(st, base + 4);
  r.image         = ColText(st, base + 5);
  r.stock         = ColI64(st, base + 6);
  r.version       = ColU64(st, base + 7);
  r.deleted_at_ms = ColOptU64(st, base + 8);
  return r;
}

std::string Placeholders(std::size_t first, std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i) out += ",";
    out += "?" + std::to_string(first + i);
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::vector<model::TranslationRecord> SqliteRepository::LoadTranslations(sqlite3* db, int64_t product_id) {
  Statement st(db, "SELECT id,language_id,name,description FROM product_translation WHERE product_id=?1 ORDER BY id;");
  BindI64(st.get(), 1, product_id);

  std::vector<model::TranslationRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(model::TranslationRecord{ColI64(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2), ColText(st.get(), 3)});
  }
  return out;
}

std::vector<model::OrderItemRecord> SqliteRepository::LoadItems(sqlite3* db, int64_t order_id) {
  Statement st(db,
               "SELECT id,order_id,sku_id,product_id,product_name,sku_price,image,sku_value,quantity,product_translations,"
               "created_at_ms FROM order_item WHERE order_id=?1 ORDER BY id;");
  BindI64(st.get(), 1, order_id);

  std::vector<model::OrderItemRecord> out;
  while (st.Step() == SQLITE_ROW) {
    auto*                  s = st.get();
    model::OrderItemRecord r;
    r.id                    = ColI64(s, 0);
    r.order_id              = ColI64(s, 1);
    r.sku_id                = ColOptI64(s, 2);
    r.product_id            = ColOptI64(s, 3);
    r.snapshot.product_name = ColText(s, 4);
    r.snapshot.sku_price    = ColI64(s, 5);
    r.snapshot.image        = ColText(s, 6);
    r.snapshot.sku_value    = ColText(s, 7);
    r.snapshot.quantity     = sqlite3_column_int(s, 8);
    r.snapshot.translations = DecodeTranslations(ColText(s, 9));
    r.created_at_ms         = ColU64(s, 10);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::InsertProduct(Transaction& t, model::ProductRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO product(id,name,published_at_ms,deleted_at_ms) VALUES(?1,?2,?3,?4);");
  BindId(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindOpt(st.get(), 3, r.published_at_ms);
  BindOpt(st.get(), 4, r.deleted_at_ms);
  if (auto res = Translate(db, st.Step()); !res) return res;
  r.id = sqlite3_last_insert_rowid(db);

  Statement tr(db, "INSERT INTO product_translation(id,product_id,language_id,name,description) VALUES(?1,?2,?3,?4,?5);");
  for (auto& translation : r.translations) {
    tr.Reset();
    BindId(tr.get(), 1, translation.id);
    BindI64(tr.get(), 2, r.id);
    BindText(tr.get(), 3, translation.language_id);
    BindText(tr.get(), 4, translation.name);
    BindText(tr.get(), 5, translation.description);
    if (auto res = Translate(db, tr.Step()); !res) return res;
    translation.id = sqlite3_last_insert_rowid(db);
  }
  return Result::Ok();
}

Result SqliteRepository::InsertSku(Transaction& t, model::SkuRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO sku(id,product_id,created_by,value,price,image,stock,version,deleted_at_ms) "
               "VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9);");
  BindId(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.product_id);
  BindI64(st.get(), 3, r.created_by);
  BindText(st.get(), 4, r.value);
  BindI64(st.get(), 5, r.price);
  BindText(st.get(), 6, r.image);
  BindI64(st.get(), 7, r.stock);
  BindU64(st.get(), 8, r.version);
  BindOpt(st.get(), 9, r.deleted_at_ms);

  auto res = Translate(db, st.Step());
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

std::optional<model::SkuRecord> SqliteRepository::GetSku(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,product_id,created_by,value,price,image,stock,version,deleted_at_ms FROM sku WHERE id=?1;");
  BindI64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSku(st.get(), 0);
}

Result SqliteRepository::UpdateSku(Transaction& t, const model::SkuRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE sku SET product_id=?1,created_by=?2,value=?3,price=?4,image=?5,stock=?6,deleted_at_ms=?7,"
               "version=version+1 WHERE id=?8;");
  BindI64(st.get(), 1, r.product_id);
  BindI64(st.get(), 2, r.created_by);
  BindText(st.get(), 3, r.value);
  BindI64(st.get(), 4, r.price);
  BindText(st.get(), 5, r.image);
  BindI64(st.get(), 6, r.stock);
  BindOpt(st.get(), 7, r.deleted_at_ms);
  BindI64(st.get(), 8, r.id);

  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::DeleteSku(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  // order_item.sku_id -> NULL and cart_item rows cascade via foreign keys
  Statement st(db, "DELETE FROM sku WHERE id=?1;");
  BindI64(st.get(), 1, id);
  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cart
// ------------------------------------------------------------------

Result SqliteRepository::InsertCartItem(Transaction& t, model::CartItemRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO cart_item(id,user_id,sku_id,quantity) VALUES(?1,?2,?3,?4);");
  BindId(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.user_id);
  BindI64(st.get(), 3, r.sku_id);
  sqlite3_bind_int(st.get(), 4, r.quantity);

  auto res = Translate(db, st.Step());
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

std::vector<model::CartLine> SqliteRepository::GetCartLines(Transaction& t, int64_t user_id, const std::vector<int64_t>& ids) {
  if (ids.empty()) return {};
  auto* db = TX(t).Handle();

  const std::string sql =
      "SELECT c.id,c.user_id,c.sku_id,c.quantity,"
      "s.id,s.product_id,s.created_by,s.value,s.price,s.image,s.stock,s.version,s.deleted_at_ms,"
      "p.id,p.name,p.published_at_ms,p.deleted_at_ms "
      "FROM cart_item c JOIN sku s ON s.id=c.sku_id JOIN product p ON p.id=s.product_id "
      "WHERE c.user_id=?1 AND c.id IN (" +
      Placeholders(2, ids.size()) + ") ORDER BY c.id;";

  Statement st(db, sql.c_str());
  BindI64(st.get(), 1, user_id);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    BindI64(st.get(), static_cast<int>(i + 2), ids[i]);
  }

  std::vector<model::CartLine> lines;
  while (st.Step() == SQLITE_ROW) {
    auto*           s = st.get();
    model::CartLine line;
    line.item.id                 = ColI64(s, 0);
    line.item.user_id            = ColI64(s, 1);
    line.item.sku_id             = ColI64(s, 2);
    line.item.quantity           = sqlite3_column_int(s, 3);
    line.sku                     = ReadSku(s, 4);
    line.product.id              = ColI64(s, 13);
    line.product.name            = ColText(s, 14);
    line.product.published_at_ms = ColOptU64(s, 15);
    line.product.deleted_at_ms   = ColOptU64(s, 16);
    lines.push_back(std::move(line));
  }

  std::map<int64_t, std::vector<model::TranslationRecord>> translations;
  for (auto& line : lines) {
    auto it = translations.find(line.product.id);
    if (it == translations.end()) {
      it = translations.emplace(line.product.id, LoadTranslations(db, line.product.id)).first;
    }
    line.product.translations = it->second;
  }
  return lines;
}

Result SqliteRepository::DeleteCartItems(Transaction& t, const std::vector<int64_t>& ids) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM cart_item WHERE id=?1;");
  for (auto id : ids) {
    st.Reset();
    BindI64(st.get(), 1, id);
    if (auto res = Translate(db, st.Step()); !res) return res;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Stock
// ------------------------------------------------------------------

Result SqliteRepository::DecrementStock(Transaction& t, int64_t sku_id, int64_t quantity, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE sku SET stock=stock-?1, version=version+1 WHERE id=?2 AND version=?3 AND stock>=?1;");
  BindI64(st.get(), 1, quantity);
  BindI64(st.get(), 2, sku_id);
  BindU64(st.get(), 3, expected_version);

  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::Conflict, "stock guard failed for sku " + std::to_string(sku_id));
  }
  return Result::Ok();
}

Result SqliteRepository::IncrementStock(Transaction& t, int64_t sku_id, int64_t quantity) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE sku SET stock=stock+?1, version=version+1 WHERE id=?2;");
  BindI64(st.get(), 1, quantity);
  BindI64(st.get(), 2, sku_id);

  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto* db = TX(t).Handle();
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;

  Statement st(db, "INSERT INTO payment(status,created_at_ms,updated_at_ms) VALUES(?1,?2,?3);");
  BindText(st.get(), 1, StatusText(r.status));
  BindU64(st.get(), 2, r.created_at_ms);
  BindU64(st.get(), 3, r.updated_at_ms);

  auto res = Translate(db, st.Step());
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

std::optional<model::PaymentRecord> SqliteRepository::GetPayment(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,status,created_at_ms,updated_at_ms FROM payment WHERE id=?1;");
  BindI64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::PaymentRecord r;
  r.id            = ColI64(st.get(), 0);
  r.status        = checkout::model::ParsePaymentStatus(ColText(st.get(), 1)).value_or(PaymentStatus::kUnspecified);
  r.created_at_ms = ColU64(st.get(), 2);
  r.updated_at_ms = ColU64(st.get(), 3);
  return r;
}

Result SqliteRepository::UpdatePaymentStatus(Transaction& t, int64_t id, PaymentStatus from, PaymentStatus to) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE payment SET status=?1, updated_at_ms=?2 WHERE id=?3 AND status=?4;");
  BindText(st.get(), 1, StatusText(to));
  BindU64(st.get(), 2, NowMs());
  BindI64(st.get(), 3, id);
  BindText(st.get(), 4, StatusText(from));

  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetPayment(t, id)) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "payment status changed");
  }
  return Result::Ok();
}

Result SqliteRepository::InsertPaymentTransaction(Transaction& t, const model::PaymentTransactionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO payment_transaction(id,gateway,transaction_date,account_number,code,content,amount_in,amount_out,"
               "accumulated,sub_account,reference_code,description,created_at_ms) VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.gateway);
  BindText(st.get(), 3, r.transaction_date);
  BindText(st.get(), 4, r.account_number);
  BindOpt(st.get(), 5, r.code);
  BindOpt(st.get(), 6, r.content);
  BindI64(st.get(), 7, r.amount_in);
  BindI64(st.get(), 8, r.amount_out);
  BindI64(st.get(), 9, r.accumulated);
  BindText(st.get(), 10, r.sub_account);
  BindText(st.get(), 11, r.reference_code);
  BindText(st.get(), 12, r.description);
  BindU64(st.get(), 13, r.created_at_ms == 0 ? NowMs() : r.created_at_ms);

  return Translate(db, st.Step());
}

std::optional<model::PaymentTransactionRecord> SqliteRepository::GetPaymentTransaction(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,gateway,transaction_date,account_number,code,content,amount_in,amount_out,accumulated,sub_account,"
               "reference_code,description,created_at_ms FROM payment_transaction WHERE id=?1;");
  BindText(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto*                           s = st.get();
  model::PaymentTransactionRecord r;
  r.id               = ColText(s, 0);
  r.gateway          = ColText(s, 1);
  r.transaction_date = ColText(s, 2);
  r.account_number   = ColText(s, 3);
  r.code             = ColOptText(s, 4);
  r.content          = ColOptText(s, 5);
  r.amount_in        = ColI64(s, 6);
  r.amount_out       = ColI64(s, 7);
  r.accumulated      = ColI64(s, 8);
  r.sub_account      = ColText(s, 9);
  r.reference_code   = ColText(s, 10);
  r.description      = ColText(s, 11);
  r.created_at_ms    = ColU64(s, 12);
  return r;
}

// ------------------------------------------------------------------
// Orders
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrder(Transaction& t, model::OrderRecord& r) {
  auto* db = TX(t).Handle();
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;

  Statement st(db,
               "INSERT INTO orders(user_id,shop_id,payment_id,status,receiver_name,receiver_phone,receiver_address,created_by,"
               "updated_by,created_at_ms,updated_at_ms,deleted_at_ms) VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12);");
  BindI64(st.get(), 1, r.user_id);
  BindI64(st.get(), 2, r.shop_id);
  BindI64(st.get(), 3, r.payment_id);
  BindText(st.get(), 4, StatusText(r.status));
  BindText(st.get(), 5, r.receiver.name);
  BindText(st.get(), 6, r.receiver.phone);
  BindText(st.get(), 7, r.receiver.address);
  BindI64(st.get(), 8, r.created_by);
  BindOpt(st.get(), 9, r.updated_by);
  BindU64(st.get(), 10, r.created_at_ms);
  BindU64(st.get(), 11, r.updated_at_ms);
  BindOpt(st.get(), 12, r.deleted_at_ms);
  if (auto res = Translate(db, st.Step()); !res) return res;
  r.id = sqlite3_last_insert_rowid(db);

  Statement item_st(db,
                    "INSERT INTO order_item(order_id,sku_id,product_id,product_name,sku_price,image,sku_value,quantity,"
                    "product_translations,created_at_ms) VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10);");
  for (auto& item : r.items) {
    if (item.created_at_ms == 0) item.created_at_ms = r.created_at_ms;
    item_st.Reset();
    BindI64(item_st.get(), 1, r.id);
    BindOpt(item_st.get(), 2, item.sku_id);
    BindOpt(item_st.get(), 3, item.product_id);
    BindText(item_st.get(), 4, item.snapshot.product_name);
    BindI64(item_st.get(), 5, item.snapshot.sku_price);
    BindText(item_st.get(), 6, item.snapshot.image);
    BindText(item_st.get(), 7, item.snapshot.sku_value);
    sqlite3_bind_int(item_st.get(), 8, item.snapshot.quantity);
    BindText(item_st.get(), 9, EncodeTranslations(item.snapshot.translations));
    BindU64(item_st.get(), 10, item.created_at_ms);
    if (auto res = Translate(db, item_st.Step()); !res) return res;
    item.id       = sqlite3_last_insert_rowid(db);
    item.order_id = r.id;
  }
  return Result::Ok();
}

std::optional<model::OrderRecord> SqliteRepository::GetOrder(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kOrderColumns + " FROM orders WHERE id=?1;";
  Statement         st(db, sql.c_str());
  BindI64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto order  = ReadOrder(st.get());
  order.items = LoadItems(db, order.id);
  return order;
}

std::vector<model::OrderRecord> SqliteRepository::ListOrdersByPayment(Transaction& t, int64_t payment_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kOrderColumns + " FROM orders WHERE payment_id=?1 ORDER BY id;";
  Statement         st(db, sql.c_str());
  BindI64(st.get(), 1, payment_id);

  std::vector<model::OrderRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadOrder(st.get()));
  for (auto& order : out) order.items = LoadItems(db, order.id);
  return out;
}

std::vector<model::OrderRecord> SqliteRepository::ListOrders(Transaction& t, const model::OrderFilter& f) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kOrderColumns +
                          " FROM orders WHERE user_id=?1 AND deleted_at_ms IS NULL AND (?2 IS NULL OR status=?2) "
                          "ORDER BY created_at_ms DESC, id DESC LIMIT ?3 OFFSET ?4;";
  Statement st(db, sql.c_str());
  BindI64(st.get(), 1, f.user_id);
  if (f.status)
    BindText(st.get(), 2, StatusText(*f.status));
  else
    sqlite3_bind_null(st.get(), 2);
  BindU64(st.get(), 3, f.limit);
  BindU64(st.get(), 4, f.offset);

  std::vector<model::OrderRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadOrder(st.get()));
  for (auto& order : out) order.items = LoadItems(db, order.id);
  return out;
}

uint64_t SqliteRepository::CountOrders(Transaction& t, const model::OrderFilter& f) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT COUNT(*) FROM orders WHERE user_id=?1 AND deleted_at_ms IS NULL AND (?2 IS NULL OR status=?2);");
  BindI64(st.get(), 1, f.user_id);
  if (f.status)
    BindText(st.get(), 2, StatusText(*f.status));
  else
    sqlite3_bind_null(st.get(), 2);

  if (st.Step() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::UpdateOrderStatus(Transaction& t, int64_t id, OrderStatus from, OrderStatus to,
                                           std::optional<int64_t> updated_by) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE orders SET status=?1, updated_at_ms=?2, updated_by=COALESCE(?3, updated_by) "
               "WHERE id=?4 AND status=?5;");
  BindText(st.get(), 1, StatusText(to));
  BindU64(st.get(), 2, NowMs());
  BindOpt(st.get(), 3, updated_by);
  BindI64(st.get(), 4, id);
  BindText(st.get(), 5, StatusText(from));

  if (auto res = Translate(db, st.Step()); !res) return res;
  if (sqlite3_changes(db) == 0) {
    if (!GetOrder(t, id)) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "order status changed");
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Delayed jobs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDelayedJob(Transaction& t, const model::DelayedJobRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO delayed_job(id,type,payload,run_at_ms,attempts,created_at_ms) VALUES(?1,?2,?3,?4,?5,?6) "
               "ON CONFLICT(id) DO UPDATE SET type=excluded.type, payload=excluded.payload, run_at_ms=excluded.run_at_ms, "
               "attempts=excluded.attempts;");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.type);
  BindText(st.get(), 3, r.payload);
  BindU64(st.get(), 4, r.run_at_ms);
  sqlite3_bind_int64(st.get(), 5, r.attempts);
  BindU64(st.get(), 6, r.created_at_ms == 0 ? NowMs() : r.created_at_ms);

  return Translate(db, st.Step());
}

Result SqliteRepository::DeleteDelayedJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM delayed_job WHERE id=?1;");
  BindText(st.get(), 1, id);
  return Translate(db, st.Step());
}

std::optional<model::DelayedJobRecord> SqliteRepository::GetDelayedJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,type,payload,run_at_ms,attempts,created_at_ms FROM delayed_job WHERE id=?1;");
  BindText(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  return model::DelayedJobRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2),
                                 ColU64(st.get(), 3), static_cast<uint32_t>(ColU64(st.get(), 4)), ColU64(st.get(), 5)};
}

std::vector<model::DelayedJobRecord> SqliteRepository::ListDueDelayedJobs(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,type,payload,run_at_ms,attempts,created_at_ms FROM delayed_job WHERE run_at_ms<=?1 "
               "ORDER BY run_at_ms, id LIMIT ?2;");
  BindU64(st.get(), 1, now_ms);
  BindU64(st.get(), 2, limit);

  std::vector<model::DelayedJobRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(model::DelayedJobRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2),
                                          ColU64(st.get(), 3), static_cast<uint32_t>(ColU64(st.get(), 4)), ColU64(st.get(), 5)});
  }
  return out;
}

} // namespace checkout::db::sqlite
