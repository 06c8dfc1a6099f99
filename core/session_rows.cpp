#include "core/session_rows.h"

#include "core/status_macros.h"

namespace convo {
namespace rows {

absl::StatusOr<bool> SessionExists(Database::Connection& conn, const std::string& key) {
  ASSIGN_OR_RETURN(auto stmt, conn.Prepare("SELECT 1 FROM sessions WHERE key = ?"));
  RETURN_IF_ERROR(stmt->BindText(1, key));
  return stmt->Step();
}

absl::StatusOr<bool> InsertSessionIfAbsent(Database::Connection& conn, const std::string& key,
                                           const std::string& summary, const std::string& created_at,
                                           const std::string& updated_at) {
  ASSIGN_OR_RETURN(bool exists, SessionExists(conn, key));
  if (exists) return false;
  RETURN_IF_ERROR(conn.Execute("INSERT INTO sessions (key, summary, created_at, updated_at) VALUES (?, ?, ?, ?)",
                               key, summary, created_at, updated_at));
  return true;
}

absl::Status EnsureSession(Database::Connection& conn, const std::string& key, const std::string& now) {
  return InsertSessionIfAbsent(conn, key, "", now, now).status();
}

absl::Status TouchSession(Database::Connection& conn, const std::string& key, const std::string& now) {
  return conn.Execute("UPDATE sessions SET updated_at = ? WHERE key = ?", now, key);
}

absl::StatusOr<int64_t> NextSeq(Database::Connection& conn, const std::string& key) {
  ASSIGN_OR_RETURN(auto stmt, conn.Prepare("SELECT MAX(seq) FROM messages WHERE session_key = ?"));
  RETURN_IF_ERROR(stmt->BindText(1, key));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row || stmt->ColumnIsNull(0)) return 1;
  return stmt->ColumnInt64(0) + 1;
}

absl::StatusOr<int64_t> CountMessages(Database::Connection& conn, const std::string& key) {
  ASSIGN_OR_RETURN(auto stmt, conn.Prepare("SELECT COUNT(*) FROM messages WHERE session_key = ?"));
  RETURN_IF_ERROR(stmt->BindText(1, key));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row) return 0;
  return stmt->ColumnInt64(0);
}

absl::Status InsertMessage(Database::Connection& conn, const std::string& key, int64_t seq, const Message& msg,
                           const std::string& created_at) {
  return conn.Execute(
      "INSERT INTO messages (session_key, seq, role, content, tool_calls_json, tool_call_id, created_at) "
      "VALUES (?, ?, ?, ?, ?, ?, ?)",
      key, seq, msg.role, msg.content, EncodeToolCalls(msg.tool_calls), msg.tool_call_id, created_at);
}

absl::Status DeleteMessages(Database::Connection& conn, const std::string& key) {
  return conn.Execute("DELETE FROM messages WHERE session_key = ?", key);
}

}  // namespace rows
}  // namespace convo
