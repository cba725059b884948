#include "auditchain/storage/sqlite.hpp"
#include "auditchain/core/errors.hpp"


namespace auditchain::storage::sqlite {

  void throw_sqlite_error(sqlite3* db, const std::string& context) {
    std::string message = db ? sqlite3_errmsg(db) : "out of memory";
    throw core::PersistenceError("sqlite: " + context + ": " + message);
  }

  Database::Database(const std::filesystem::path& path, int flags) : db_(nullptr, &sqlite3_close_v2) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    db_.reset(raw);
    if (rc != SQLITE_OK) throw_sqlite_error(raw, "open " + path.string());
    sqlite3_extended_result_codes(raw, 1);
    sqlite3_busy_timeout(raw, 5000);
  }

  void Database::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
      std::string message = err ? err : sqlite3_errmsg(db_.get());
      sqlite3_free(err);
      throw core::PersistenceError("sqlite: exec '" + sql.substr(0, 40) + "': " + message);
    }
  }

  Statement Database::prepare(const std::string& sql) const {
    return Statement(db_.get(), sql);
  }

  Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr, &sqlite3_finalize) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
      throw_sqlite_error(db, "prepare '" + sql.substr(0, 40) + "'");
    }
    stmt_.reset(raw);
  }

  Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_.get(), index, value) != SQLITE_OK) throw_sqlite_error(db_, "bind int");
    return *this;
  }

  Statement& Statement::bind(int index, std::string_view value) {
    if (sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
      throw_sqlite_error(db_, "bind text");
    return *this;
  }

  Statement& Statement::bind(int index, std::span<const uint8_t> value) {
    // A zero-length blob must still bind as a blob, not NULL.
    static const uint8_t empty = 0;
    const void* data = value.empty() ? static_cast<const void*>(&empty) : value.data();
    if (sqlite3_bind_blob(stmt_.get(), index, data, static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
      throw_sqlite_error(db_, "bind blob");
    return *this;
  }

  Statement& Statement::bind_null(int index) {
    if (sqlite3_bind_null(stmt_.get(), index) != SQLITE_OK) throw_sqlite_error(db_, "bind null");
    return *this;
  }

  bool Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, "step");
  }

  void Statement::reset() {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }

  int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_.get(), column);
  }

  std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_.get(), column);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), column)));
  }

  std::vector<uint8_t> Statement::column_blob(int column) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_.get(), column));
    auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), column));
    if (!data || size == 0) return {};
    return std::vector<uint8_t>(data, data + size);
  }

  bool Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
  }

  Transaction::Transaction(Database& db, Mode mode) : db_(db) {
    db_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
  }

  Transaction::~Transaction() {
    if (!done_) sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
  }

  void Transaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
  }
}
