#ifndef CONVO_CORE_SESSION_ROWS_H_
#define CONVO_CORE_SESSION_ROWS_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/database.h"
#include "core/message.h"

namespace convo {
namespace rows {

// Statement-level helpers shared by SessionStore and the legacy importer.
// Callers run them inside Database::RunInTransaction.

absl::StatusOr<bool> SessionExists(Database::Connection& conn, const std::string& key);

// Inserts the session row unless one already exists; an existing row is never
// modified. Returns true if a row was inserted.
absl::StatusOr<bool> InsertSessionIfAbsent(Database::Connection& conn, const std::string& key,
                                           const std::string& summary, const std::string& created_at,
                                           const std::string& updated_at);

// Creates an empty session stamped `now` unless it exists.
absl::Status EnsureSession(Database::Connection& conn, const std::string& key, const std::string& now);

absl::Status TouchSession(Database::Connection& conn, const std::string& key, const std::string& now);

// max(seq) + 1 for the session, or 1 when it has no messages.
absl::StatusOr<int64_t> NextSeq(Database::Connection& conn, const std::string& key);

absl::StatusOr<int64_t> CountMessages(Database::Connection& conn, const std::string& key);

absl::Status InsertMessage(Database::Connection& conn, const std::string& key, int64_t seq, const Message& msg,
                           const std::string& created_at);

absl::Status DeleteMessages(Database::Connection& conn, const std::string& key);

}  // namespace rows
}  // namespace convo

#endif  // CONVO_CORE_SESSION_ROWS_H_
