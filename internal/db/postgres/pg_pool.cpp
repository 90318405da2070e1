#include "pg_pool.hpp"

namespace checkout::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("decrement_stock",
               "UPDATE sku SET stock=stock-$1, version=version+1 "
               "WHERE id=$2 AND version=$3 AND stock>=$1");

  conn.prepare("increment_stock", "UPDATE sku SET stock=stock+$1, version=version+1 WHERE id=$2");

  conn.prepare("get_sku",
               "SELECT id,product_id,created_by,value,price,image,stock,version,deleted_at_ms "
               "FROM sku WHERE id=$1");

  conn.prepare("get_payment", "SELECT id,status,created_at_ms,updated_at_ms FROM payment WHERE id=$1");

  conn.prepare("update_payment_status",
               "UPDATE payment SET status=$1, updated_at_ms=$2 WHERE id=$3 AND status=$4");

  conn.prepare("update_order_status",
               "UPDATE orders SET status=$1, updated_at_ms=$2, updated_by=COALESCE($3, updated_by) "
               "WHERE id=$4 AND status=$5");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace checkout::db::postgres
