#ifndef CONVO_CORE_SESSION_STORE_H_
#define CONVO_CORE_SESSION_STORE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/cancellation.h"
#include "core/database.h"
#include "core/message.h"

namespace convo {

/**
 * @brief Persistent session state: ordered message histories plus a rolling
 * summary per session key.
 *
 * Sessions are created implicitly by the first write. Every mutation runs in a
 * single transaction on the store's only connection, so sequence numbers are
 * assigned without gaps or races and a failed operation leaves no trace.
 */
class SessionStore {
 public:
  static absl::StatusOr<std::unique_ptr<SessionStore>> Open(
      const std::string& db_path, const Database::Options& options = {},
      std::shared_ptr<CancellationRequest> cancellation = nullptr);

  static absl::StatusOr<std::unique_ptr<SessionStore>> Create(std::unique_ptr<Database> db) {
    if (db == nullptr) {
      return absl::InvalidArgumentError("Database cannot be null");
    }
    return std::unique_ptr<SessionStore>(new SessionStore(std::move(db)));
  }

 private:
  explicit SessionStore(std::unique_ptr<Database> db) : db_(std::move(db)) {}

 public:
  // Appends a message without tool-call data.
  absl::Status AddMessage(const std::string& session_key, const std::string& role, const std::string& content,
                          std::shared_ptr<CancellationRequest> cancellation = nullptr);

  /**
   * @brief Appends `message` to the session, creating the session if needed.
   *
   * The message gets seq = max(seq) + 1 (1 for a new session); any seq set on
   * `message` is ignored. The session's updated_at is refreshed.
   */
  absl::Status AddFullMessage(const std::string& session_key, const Message& message,
                              std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // All messages of the session by ascending seq. Empty for an unknown session.
  absl::StatusOr<std::vector<Message>> GetHistory(const std::string& session_key,
                                                  std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // Empty string for an unknown session.
  absl::StatusOr<std::string> GetSummary(const std::string& session_key,
                                         std::shared_ptr<CancellationRequest> cancellation = nullptr);

  absl::Status SetSummary(const std::string& session_key, const std::string& summary,
                          std::shared_ptr<CancellationRequest> cancellation = nullptr);

  /**
   * @brief Keeps only the `keep_last` most recent messages.
   *
   * keep_last <= 0 removes every message. updated_at is refreshed even when
   * nothing was deleted.
   */
  absl::Status TruncateHistory(const std::string& session_key, int keep_last,
                               std::shared_ptr<CancellationRequest> cancellation = nullptr);

  /**
   * @brief Replaces the whole history of the session.
   *
   * Messages are renumbered 1..N in input order. Readers observe either the old
   * or the new history, never a mix.
   */
  absl::Status SetHistory(const std::string& session_key, const std::vector<Message>& messages,
                          std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // NotFoundError if the session does not exist.
  absl::StatusOr<Session> GetSession(const std::string& session_key,
                                     std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // Releases the connection. Later operations fail with FailedPreconditionError.
  void Close();

  Database* database() { return db_.get(); }

 private:
  std::unique_ptr<Database> db_;
};

}  // namespace convo

#endif  // CONVO_CORE_SESSION_STORE_H_
