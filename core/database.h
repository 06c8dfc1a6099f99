#ifndef CONVO_CORE_DATABASE_H_
#define CONVO_CORE_DATABASE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "core/cancellation.h"
#include "core/constants.h"

#include <sqlite3.h>

namespace convo {

struct DatabaseOptions {
  int busy_timeout_ms = kDefaultBusyTimeoutMs;
  int cache_size_kib = kDefaultCacheSizeKib;
};

// Owner of the single SQLite connection. Every access to the connection goes
// through Run() or RunInTransaction(), which hold the connection for the whole
// unit of work, so concurrent callers queue instead of interleaving statements.
class Database {
 public:
  using Options = DatabaseOptions;

  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
      if (stmt) sqlite3_finalize(stmt);
    }
  };
  using UniqueStmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

  class Statement {
   public:
    Statement(sqlite3* db, const std::string& sql, const CancellationRequest* cancellation)
        : db_(db), sql_(sql), cancellation_(cancellation) {}

    absl::Status Prepare();
    absl::Status BindInt(int index, int value);
    absl::Status BindInt64(int index, int64_t value);
    absl::Status BindText(int index, const std::string& value);
    absl::Status BindNull(int index);

    absl::Status Bind(int index, int value) { return BindInt(index, value); }
    absl::Status Bind(int index, int64_t value) { return BindInt64(index, value); }
    absl::Status Bind(int index, const std::string& value) { return BindText(index, value); }
    absl::Status Bind(int index, const char* value) { return BindText(index, value ? value : ""); }
    absl::Status Bind(int index, std::nullptr_t) { return BindNull(index); }
    absl::Status Bind(int index, const std::optional<std::string>& value) {
      return value.has_value() ? BindText(index, *value) : BindNull(index);
    }

    template <typename... Args>
    absl::Status BindAll(Args&&... args) {
      return BindRecursive(1, std::forward<Args>(args)...);
    }

    absl::StatusOr<bool> Step();  // Returns true if a row is available (SQLITE_ROW)
    absl::Status Run();           // For operations that don't return rows (SQLITE_DONE)

    int ColumnInt(int index);
    int64_t ColumnInt64(int index);
    std::string ColumnText(int index);
    bool ColumnIsNull(int index);
    std::optional<std::string> ColumnOptionalText(int index);

   private:
    absl::Status BindRecursive(int /*index*/) { return absl::OkStatus(); }

    template <typename T, typename... Rest>
    absl::Status BindRecursive(int index, T&& first, Rest&&... rest) {
      auto status = Bind(index, std::forward<T>(first));
      if (!status.ok()) return status;
      return BindRecursive(index + 1, std::forward<Rest>(rest)...);
    }

    absl::Status StepError(int rc);

    sqlite3* db_;
    std::string sql_;
    const CancellationRequest* cancellation_;
    UniqueStmt stmt_;
  };

  // Handle to the connection, valid only for the duration of one Run() or
  // RunInTransaction() callback.
  class Connection {
   public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    absl::StatusOr<std::unique_ptr<Statement>> Prepare(const std::string& sql);

    absl::Status Execute(const std::string& sql);

    template <typename... Args>
    absl::Status Execute(const std::string& sql, Args&&... args) {
      auto stmt_or = Prepare(sql);
      if (!stmt_or.ok()) return stmt_or.status();
      auto bind_status = (*stmt_or)->BindAll(std::forward<Args>(args)...);
      if (!bind_status.ok()) return bind_status;
      return (*stmt_or)->Run();
    }

    // Runs one or more ';'-separated statements without parameters.
    absl::Status ExecuteScript(const std::string& sql);

    // Rows modified by the most recent INSERT, UPDATE or DELETE.
    int Changes() const;

   private:
    friend class Database;
    Connection(sqlite3* db, const CancellationRequest* cancellation) : db_(db), cancellation_(cancellation) {}

    sqlite3* db_;
    const CancellationRequest* cancellation_;
  };

  using Work = std::function<absl::Status(Connection&)>;

  // Opens (creating if needed) the database at `db_path`, creates the parent
  // directory, applies the tuning pragmas and ensures the schema. Any failure
  // closes the connection and is returned.
  static absl::StatusOr<std::unique_ptr<Database>> Open(const std::string& db_path, const Options& options = {},
                                                        std::shared_ptr<CancellationRequest> cancellation = nullptr);

  ~Database();

  // Non-copyable
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Runs `work` with exclusive use of the connection.
  absl::Status Run(const std::shared_ptr<CancellationRequest>& cancellation, const Work& work);

  // Like Run(), inside BEGIN IMMEDIATE / COMMIT. Rolls back if `work` or the
  // commit fails.
  absl::Status RunInTransaction(const std::shared_ptr<CancellationRequest>& cancellation, const Work& work);

  // Closes the connection. Later Run* calls fail with FailedPreconditionError.
  void Close();
  bool IsOpen() const;

  const std::string& path() const { return path_; }

 private:
  struct DbDeleter {
    void operator()(sqlite3* db) const {
      if (db) sqlite3_close_v2(db);
    }
  };

  explicit Database(std::string path) : path_(std::move(path)) {}

  absl::Status RunLocked(CancellationRequest* cancellation, const Work& work, bool transactional)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  std::string path_;
  mutable absl::Mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_ ABSL_GUARDED_BY(mu_);
};

}  // namespace convo

#endif  // CONVO_CORE_DATABASE_H_
