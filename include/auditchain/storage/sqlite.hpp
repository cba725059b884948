#pragma once
#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace auditchain::storage::sqlite {

  class Statement;

  // Owns one SQLite connection. Every failure throws core::PersistenceError.
  class Database {
    public:
      Database(const std::filesystem::path& path, int flags);

      sqlite3* handle() const { return db_.get(); }

      void exec(const std::string& sql);
      Statement prepare(const std::string& sql) const;
      int64_t changes() const { return sqlite3_changes64(db_.get()); }

    private:
      std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> db_;
  };

  class Statement {
    public:
      Statement(sqlite3* db, const std::string& sql);

      Statement& bind(int index, int64_t value);
      Statement& bind(int index, std::string_view value);
      Statement& bind(int index, std::span<const uint8_t> value);
      Statement& bind_null(int index);

      // Returns true while a row is available, false once the statement is done.
      bool step();
      void reset();

      int64_t column_int64(int column) const;
      std::string column_text(int column) const;
      std::vector<uint8_t> column_blob(int column) const;
      bool column_is_null(int column) const;

    private:
      sqlite3* db_;
      std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_;
  };

  // Scoped transaction; rolls back on destruction unless committed.
  class Transaction {
    public:
      enum class Mode { Deferred, Immediate };

      explicit Transaction(Database& db, Mode mode = Mode::Immediate);
      ~Transaction();

      Transaction(const Transaction&) = delete;
      Transaction& operator=(const Transaction&) = delete;

      void commit();

    private:
      Database& db_;
      bool done_ = false;
  };

  [[noreturn]] void throw_sqlite_error(sqlite3* db, const std::string& context);
}
