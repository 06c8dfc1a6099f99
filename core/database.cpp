#include "core/database.h"

#include <filesystem>
#include <memory>
#include <system_error>

#include "absl/base/thread_annotations.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"

#include "core/schema.h"
#include "core/status_macros.h"

#include <sqlite3.h>
namespace convo {

namespace {

// Interrupts the running statement once the operation context is cancelled or
// past its deadline.
int ProgressHandler(void* arg) {
  const auto* cancellation = static_cast<const CancellationRequest*>(arg);
  return cancellation->IsCancelled() || cancellation->DeadlineExceeded() ? 1 : 0;
}

// Target of the cancellation callback registered for one Run*() call. Cancel()
// may fire long after the call returned, so the connection is only interrupted
// while the call is still in progress.
class InterruptTarget {
 public:
  explicit InterruptTarget(sqlite3* db) : db_(db) {}

  void Interrupt() {
    absl::MutexLock lock(&mu_);
    if (db_ != nullptr) sqlite3_interrupt(db_);
  }

  void Release() {
    absl::MutexLock lock(&mu_);
    db_ = nullptr;
  }

 private:
  absl::Mutex mu_;
  sqlite3* db_ ABSL_GUARDED_BY(mu_);
};

absl::Status CreateParentDirectory(const std::string& db_path) {
  if (db_path.empty() || db_path == ":memory:" || db_path.rfind("file:", 0) == 0) {
    return absl::OkStatus();
  }
  std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
  if (parent.empty()) return absl::OkStatus();
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return absl::InternalError(absl::StrCat("create directory ", parent.string(), ": ", ec.message()));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status Database::Statement::Prepare() {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    LOG(ERROR) << "Prepare error: " << err << " (SQL: " << sql_ << ")";
    return absl::InternalError("Prepare error: " + err + " (SQL: " + sql_ + ")");
  }
  stmt_.reset(raw_stmt);
  return absl::OkStatus();
}

absl::Status Database::Statement::BindInt(int index, int value) {
  if (sqlite3_bind_int(stmt_.get(), index, value) != SQLITE_OK) {
    return absl::InternalError("BindInt error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindInt64(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_.get(), index, value) != SQLITE_OK) {
    return absl::InternalError("BindInt64 error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindText(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
      SQLITE_OK) {
    return absl::InternalError("BindText error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::Status Database::Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_.get(), index) != SQLITE_OK) {
    return absl::InternalError("BindNull error: " + std::string(sqlite3_errmsg(db_)));
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> Database::Statement::Step() {
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  return StepError(rc);
}

absl::Status Database::Statement::StepError(int rc) {
  if (rc == SQLITE_INTERRUPT) {
    if (cancellation_ != nullptr) {
      absl::Status status = cancellation_->ToStatus();
      if (!status.ok()) return status;
    }
    return absl::CancelledError("statement interrupted");
  }
  std::string err = sqlite3_errmsg(db_);
  LOG(ERROR) << "Step error: " << err << " (SQL: " << sql_ << ")";
  std::string message = "Step error: " + err + " (SQL: " + sql_ + ")";
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    return absl::UnavailableError(message);
  }
  return absl::InternalError(message);
}

absl::Status Database::Statement::Run() {
  auto res = Step();
  if (!res.ok()) return res.status();
  return absl::OkStatus();
}

int Database::Statement::ColumnInt(int index) { return sqlite3_column_int(stmt_.get(), index); }

int64_t Database::Statement::ColumnInt64(int index) { return sqlite3_column_int64(stmt_.get(), index); }

std::string Database::Statement::ColumnText(int index) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), index));
  if (text == nullptr) return "";
  return std::string(text, sqlite3_column_bytes(stmt_.get(), index));
}

bool Database::Statement::ColumnIsNull(int index) { return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL; }

std::optional<std::string> Database::Statement::ColumnOptionalText(int index) {
  if (ColumnIsNull(index)) return std::nullopt;
  return ColumnText(index);
}

absl::StatusOr<std::unique_ptr<Database::Statement>> Database::Connection::Prepare(const std::string& sql) {
  if (cancellation_ != nullptr) {
    RETURN_IF_ERROR(cancellation_->ToStatus());
  }
  auto stmt = std::make_unique<Statement>(db_, sql, cancellation_);
  auto status = stmt->Prepare();
  if (!status.ok()) return status;
  return stmt;
}

absl::Status Database::Connection::Execute(const std::string& sql) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(sql));
  return stmt->Run();
}

absl::Status Database::Connection::ExecuteScript(const std::string& sql) {
  char* raw_err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &raw_err);
  if (rc != SQLITE_OK) {
    std::string err = raw_err ? raw_err : sqlite3_errmsg(db_);
    sqlite3_free(raw_err);
    LOG(ERROR) << "Exec error: " << err;
    return absl::InternalError("Exec error: " + err);
  }
  return absl::OkStatus();
}

int Database::Connection::Changes() const { return sqlite3_changes(db_); }

absl::StatusOr<std::unique_ptr<Database>> Database::Open(const std::string& db_path, const Options& options,
                                                          std::shared_ptr<CancellationRequest> cancellation) {
  LOG(INFO) << "Opening database at " << db_path;
  RETURN_IF_ERROR(Annotate(CreateParentDirectory(db_path), "open database"));

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(db_path.c_str(), &raw_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string err = raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc);
    sqlite3_close_v2(raw_db);
    LOG(ERROR) << "Failed to open database: " << err;
    return absl::InternalError("Failed to open database: " + err);
  }

  std::unique_ptr<Database> db(new Database(db_path));
  {
    absl::MutexLock lock(&db->mu_);
    db->db_.reset(raw_db);
  }

  absl::Status status = db->Run(cancellation, [&options](Connection& conn) -> absl::Status {
    RETURN_IF_ERROR(ApplyPragmas(conn, options));
    return EnsureSchema(conn);
  });
  if (!status.ok()) {
    db->Close();
    return Annotate(status, "open database");
  }
  return db;
}

Database::~Database() { Close(); }

absl::Status Database::Run(const std::shared_ptr<CancellationRequest>& cancellation, const Work& work) {
  absl::MutexLock lock(&mu_);
  return RunLocked(cancellation.get(), work, /*transactional=*/false);
}

absl::Status Database::RunInTransaction(const std::shared_ptr<CancellationRequest>& cancellation,
                                        const Work& work) {
  absl::MutexLock lock(&mu_);
  return RunLocked(cancellation.get(), work, /*transactional=*/true);
}

absl::Status Database::RunLocked(CancellationRequest* cancellation, const Work& work, bool transactional) {
  if (!db_) {
    return absl::FailedPreconditionError("database is closed");
  }
  std::shared_ptr<InterruptTarget> interrupt_target;
  if (cancellation != nullptr) {
    RETURN_IF_ERROR(cancellation->ToStatus());
    // Deadlines are polled by the progress handler; Cancel() interrupts directly.
    sqlite3_progress_handler(db_.get(), kProgressHandlerOps, &ProgressHandler, cancellation);
    interrupt_target = std::make_shared<InterruptTarget>(db_.get());
    cancellation->RegisterCallback([interrupt_target] { interrupt_target->Interrupt(); });
  }

  Connection conn(db_.get(), cancellation);
  absl::Status status;
  if (transactional) {
    status = conn.Execute("BEGIN IMMEDIATE;");
    if (status.ok()) {
      status = work(conn);
    }
    if (status.ok()) {
      status = conn.Execute("COMMIT;");
    }
  } else {
    status = work(conn);
  }

  // The rollback below must not be interrupted by the same context.
  sqlite3_progress_handler(db_.get(), 0, nullptr, nullptr);
  if (interrupt_target != nullptr) interrupt_target->Release();

  if (!status.ok() && sqlite3_get_autocommit(db_.get()) == 0) {
    Connection rollback_conn(db_.get(), nullptr);
    absl::Status rollback = rollback_conn.Execute("ROLLBACK;");
    if (!rollback.ok()) {
      LOG(WARNING) << "Rollback failed: " << rollback.message();
    }
  }
  return status;
}

void Database::Close() {
  absl::MutexLock lock(&mu_);
  if (db_) {
    db_.reset();
    LOG(INFO) << "Closed database at " << path_;
  }
}

bool Database::IsOpen() const {
  absl::MutexLock lock(&mu_);
  return db_ != nullptr;
}

}  // namespace convo
