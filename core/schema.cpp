#include "core/schema.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

#include "core/status_macros.h"

namespace convo {

absl::Status ApplyPragmas(Database::Connection& conn, const Database::Options& options) {
  const std::vector<std::string> pragmas = {
      "PRAGMA journal_mode=WAL;",
      absl::StrCat("PRAGMA busy_timeout=", options.busy_timeout_ms, ";"),
      "PRAGMA synchronous=NORMAL;",
      "PRAGMA foreign_keys=ON;",
      absl::StrCat("PRAGMA cache_size=-", options.cache_size_kib, ";"),
  };
  for (const auto& pragma : pragmas) {
    RETURN_IF_ERROR(Annotate(conn.Execute(pragma), absl::StrCat("pragma \"", pragma, "\"")));
  }
  return absl::OkStatus();
}

absl::Status EnsureSchema(Database::Connection& conn) {
  const char* schema = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        key        TEXT PRIMARY KEY,
        summary    TEXT NOT NULL DEFAULT '',
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS messages (
        id              INTEGER PRIMARY KEY AUTOINCREMENT,
        session_key     TEXT    NOT NULL REFERENCES sessions(key) ON DELETE CASCADE,
        seq             INTEGER NOT NULL,
        role            TEXT    NOT NULL,
        content         TEXT    NOT NULL DEFAULT '',
        tool_calls_json TEXT,
        tool_call_id    TEXT    NOT NULL DEFAULT '',
        created_at      TEXT    NOT NULL,
        UNIQUE(session_key, seq)
    );
  )";
  return Annotate(conn.ExecuteScript(schema), "create schema");
}

}  // namespace convo
