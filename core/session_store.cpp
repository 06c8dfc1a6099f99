#include "core/session_store.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "core/session_rows.h"
#include "core/status_macros.h"

namespace convo {

namespace {

std::string OpName(const char* op, const std::string& session_key) { return absl::StrCat(op, "(", session_key, ")"); }

}  // namespace

absl::StatusOr<std::unique_ptr<SessionStore>> SessionStore::Open(const std::string& db_path,
                                                                 const Database::Options& options,
                                                                 std::shared_ptr<CancellationRequest> cancellation) {
  ASSIGN_OR_RETURN(auto db, Database::Open(db_path, options, std::move(cancellation)));
  return Create(std::move(db));
}

absl::Status SessionStore::AddMessage(const std::string& session_key, const std::string& role,
                                      const std::string& content, std::shared_ptr<CancellationRequest> cancellation) {
  Message message;
  message.role = role;
  message.content = content;
  return AddFullMessage(session_key, message, std::move(cancellation));
}

absl::Status SessionStore::AddFullMessage(const std::string& session_key, const Message& message,
                                          std::shared_ptr<CancellationRequest> cancellation) {
  absl::Status status = db_->RunInTransaction(cancellation, [&](Database::Connection& conn) -> absl::Status {
    std::string now = NowTimestamp();
    RETURN_IF_ERROR(Annotate(rows::EnsureSession(conn, session_key, now), "ensure session"));
    ASSIGN_OR_RETURN(int64_t seq, Annotate(rows::NextSeq(conn, session_key), "next seq"));
    RETURN_IF_ERROR(Annotate(rows::InsertMessage(conn, session_key, seq, message, now), "insert message"));
    return Annotate(rows::TouchSession(conn, session_key, now), "touch session");
  });
  return Annotate(status, OpName("AddFullMessage", session_key));
}

absl::StatusOr<std::vector<Message>> SessionStore::GetHistory(const std::string& session_key,
                                                              std::shared_ptr<CancellationRequest> cancellation) {
  std::vector<Message> messages;
  absl::Status status = db_->Run(cancellation, [&](Database::Connection& conn) -> absl::Status {
    ASSIGN_OR_RETURN(auto stmt, conn.Prepare("SELECT seq, role, content, tool_calls_json, tool_call_id, created_at "
                                             "FROM messages WHERE session_key = ? ORDER BY seq ASC"));
    RETURN_IF_ERROR(stmt->BindText(1, session_key));
    while (true) {
      ASSIGN_OR_RETURN(bool has_row, stmt->Step());
      if (!has_row) break;

      Message msg;
      msg.seq = stmt->ColumnInt64(0);
      msg.role = stmt->ColumnText(1);
      msg.content = stmt->ColumnText(2);
      ASSIGN_OR_RETURN(msg.tool_calls, DecodeToolCalls(stmt->ColumnOptionalText(3)));
      msg.tool_call_id = stmt->ColumnText(4);
      msg.created_at = stmt->ColumnText(5);
      messages.push_back(std::move(msg));
    }
    return absl::OkStatus();
  });
  if (!status.ok()) return Annotate(status, OpName("GetHistory", session_key));
  return messages;
}

absl::StatusOr<std::string> SessionStore::GetSummary(const std::string& session_key,
                                                     std::shared_ptr<CancellationRequest> cancellation) {
  std::string summary;
  absl::Status status = db_->Run(cancellation, [&](Database::Connection& conn) -> absl::Status {
    ASSIGN_OR_RETURN(auto stmt, conn.Prepare("SELECT summary FROM sessions WHERE key = ?"));
    RETURN_IF_ERROR(stmt->BindText(1, session_key));
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (has_row) summary = stmt->ColumnText(0);
    return absl::OkStatus();
  });
  if (!status.ok()) return Annotate(status, OpName("GetSummary", session_key));
  return summary;
}

absl::Status SessionStore::SetSummary(const std::string& session_key, const std::string& summary,
                                      std::shared_ptr<CancellationRequest> cancellation) {
  absl::Status status = db_->RunInTransaction(cancellation, [&](Database::Connection& conn) -> absl::Status {
    std::string now = NowTimestamp();
    RETURN_IF_ERROR(Annotate(rows::EnsureSession(conn, session_key, now), "ensure session"));
    return Annotate(
        conn.Execute("UPDATE sessions SET summary = ?, updated_at = ? WHERE key = ?", summary, now, session_key),
        "set summary");
  });
  return Annotate(status, OpName("SetSummary", session_key));
}

absl::Status SessionStore::TruncateHistory(const std::string& session_key, int keep_last,
                                           std::shared_ptr<CancellationRequest> cancellation) {
  absl::Status status = db_->RunInTransaction(cancellation, [&](Database::Connection& conn) -> absl::Status {
    if (keep_last <= 0) {
      RETURN_IF_ERROR(Annotate(rows::DeleteMessages(conn, session_key), "truncate history"));
    } else {
      RETURN_IF_ERROR(Annotate(conn.Execute("DELETE FROM messages WHERE session_key = ? AND id NOT IN ("
                                            "SELECT id FROM messages WHERE session_key = ? "
                                            "ORDER BY seq DESC LIMIT ?)",
                                            session_key, session_key, keep_last),
                               "truncate history"));
    }
    LOG(INFO) << "Truncated " << conn.Changes() << " messages from session " << session_key;
    return Annotate(rows::TouchSession(conn, session_key, NowTimestamp()), "touch session");
  });
  return Annotate(status, OpName("TruncateHistory", session_key));
}

absl::Status SessionStore::SetHistory(const std::string& session_key, const std::vector<Message>& messages,
                                      std::shared_ptr<CancellationRequest> cancellation) {
  absl::Status status = db_->RunInTransaction(cancellation, [&](Database::Connection& conn) -> absl::Status {
    std::string now = NowTimestamp();
    RETURN_IF_ERROR(Annotate(rows::EnsureSession(conn, session_key, now), "ensure session"));
    RETURN_IF_ERROR(Annotate(rows::DeleteMessages(conn, session_key), "delete old messages"));
    for (size_t i = 0; i < messages.size(); ++i) {
      RETURN_IF_ERROR(Annotate(rows::InsertMessage(conn, session_key, static_cast<int64_t>(i + 1), messages[i], now),
                               absl::StrCat("insert message ", i)));
    }
    return Annotate(rows::TouchSession(conn, session_key, now), "touch session");
  });
  return Annotate(status, OpName("SetHistory", session_key));
}

absl::StatusOr<Session> SessionStore::GetSession(const std::string& session_key,
                                                 std::shared_ptr<CancellationRequest> cancellation) {
  Session session;
  bool found = false;
  absl::Status status = db_->Run(cancellation, [&](Database::Connection& conn) -> absl::Status {
    ASSIGN_OR_RETURN(auto stmt,
                     conn.Prepare("SELECT key, summary, created_at, updated_at FROM sessions WHERE key = ?"));
    RETURN_IF_ERROR(stmt->BindText(1, session_key));
    ASSIGN_OR_RETURN(found, stmt->Step());
    if (found) {
      session.key = stmt->ColumnText(0);
      session.summary = stmt->ColumnText(1);
      session.created_at = stmt->ColumnText(2);
      session.updated_at = stmt->ColumnText(3);
    }
    return absl::OkStatus();
  });
  if (!status.ok()) return Annotate(status, OpName("GetSession", session_key));
  if (!found) return absl::NotFoundError(absl::StrCat("Session '", session_key, "' not found."));
  return session;
}

void SessionStore::Close() { db_->Close(); }

}  // namespace convo
