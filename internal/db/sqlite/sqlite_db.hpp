#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace checkout::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The connection is shared by every transaction; TxMutex() serializes
  them so one BEGIN..COMMIT owns the handle at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace checkout::db::sqlite
