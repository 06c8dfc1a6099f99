#ifndef CONVO_CORE_LEGACY_IMPORTER_H_
#define CONVO_CORE_LEGACY_IMPORTER_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "core/cancellation.h"
#include "core/message.h"
#include "core/session_store.h"

namespace convo {

// One session in the file-per-session JSON format that predates the store.
struct LegacySession {
  std::string key;
  std::vector<Message> messages;
  std::string summary;
  // RFC 3339 as written by the old format; may be empty.
  std::string created;
  std::string updated;
};

// Parses the content of a legacy session file. Malformed JSON or a
// non-object document is an InvalidArgumentError.
absl::StatusOr<LegacySession> ParseLegacySession(const std::string& text);

/**
 * @brief Imports every `*.json` session file in `legacy_dir` into `store`.
 *
 * Each file is imported in its own transaction and then renamed to
 * `*.json.migrated`. Unreadable, unparsable or keyless files are skipped and
 * logged. A session that already has messages is left untouched, so running
 * the import again is a no-op. Sessions are stored under the key recorded in
 * the file, never under the file name.
 *
 * @return Number of files imported and renamed. A missing directory yields 0.
 */
absl::StatusOr<int> MigrateLegacySessions(const std::string& legacy_dir, SessionStore* store,
                                          std::shared_ptr<CancellationRequest> cancellation = nullptr);

}  // namespace convo

#endif  // CONVO_CORE_LEGACY_IMPORTER_H_
