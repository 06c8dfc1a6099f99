#include "core/legacy_importer.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "core/constants.h"
#include "core/session_rows.h"
#include "core/status_macros.h"

#include <nlohmann/json.hpp>

namespace convo {

namespace {

absl::StatusOr<std::string> ReadWholeFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return absl::NotFoundError(absl::StrCat("cannot open ", path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return absl::DataLossError(absl::StrCat("read error on ", path.string()));
  }
  return buffer.str();
}

// Legacy timestamps are normalized to the store's format; anything missing or
// unparsable becomes `fallback`.
std::string NormalizeTimestamp(const std::string& text, const std::string& fallback) {
  if (text.empty()) return fallback;
  auto t = ParseTimestamp(text);
  if (!t.ok()) return fallback;
  return FormatTimestamp(*t);
}

bool IsCandidate(const std::string& name) {
  return absl::EndsWith(name, kLegacySessionSuffix) && !absl::EndsWith(name, kMigratedSuffix);
}

absl::Status ImportSession(const LegacySession& session, SessionStore* store,
                           const std::shared_ptr<CancellationRequest>& cancellation) {
  return store->database()->RunInTransaction(cancellation, [&](Database::Connection& conn) -> absl::Status {
    std::string now = NowTimestamp();
    std::string created_at = NormalizeTimestamp(session.created, now);
    std::string updated_at = NormalizeTimestamp(session.updated, now);

    RETURN_IF_ERROR(Annotate(
        rows::InsertSessionIfAbsent(conn, session.key, session.summary, created_at, updated_at).status(),
        "insert session"));

    ASSIGN_OR_RETURN(int64_t existing, Annotate(rows::CountMessages(conn, session.key), "count messages"));
    if (existing > 0) {
      LOG(INFO) << "Session " << session.key << " already has " << existing << " messages, not re-importing";
      return absl::OkStatus();
    }

    for (size_t i = 0; i < session.messages.size(); ++i) {
      RETURN_IF_ERROR(
          Annotate(rows::InsertMessage(conn, session.key, static_cast<int64_t>(i + 1), session.messages[i], now),
                   absl::StrCat("insert message ", i)));
    }
    return absl::OkStatus();
  });
}

}  // namespace

absl::StatusOr<LegacySession> ParseLegacySession(const std::string& text) {
  try {
    nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      return absl::InvalidArgumentError("legacy session is not a JSON object");
    }
    LegacySession session;
    session.key = StringOrEmpty(j, "key");
    if (j.contains("messages") && !j.at("messages").is_null()) {
      session.messages = j.at("messages").get<std::vector<Message>>();
    }
    session.summary = StringOrEmpty(j, "summary");
    session.created = StringOrEmpty(j, "created");
    session.updated = StringOrEmpty(j, "updated");
    return session;
  } catch (const nlohmann::json::exception& e) {
    return absl::InvalidArgumentError(absl::StrCat("parse legacy session: ", e.what()));
  }
}

absl::StatusOr<int> MigrateLegacySessions(const std::string& legacy_dir, SessionStore* store,
                                          std::shared_ptr<CancellationRequest> cancellation) {
  if (store == nullptr) {
    return absl::InvalidArgumentError("SessionStore cannot be null");
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(legacy_dir, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return 0;
    return absl::InternalError(absl::StrCat("read sessions dir ", legacy_dir, ": ", ec.message()));
  }

  std::vector<std::filesystem::directory_entry> entries;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    return absl::InternalError(absl::StrCat("read sessions dir ", legacy_dir, ": ", ec.message()));
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

  int migrated = 0;
  int skipped = 0;
  for (const auto& entry : entries) {
    if (cancellation != nullptr) {
      RETURN_IF_ERROR(Annotate(cancellation->ToStatus(), "migrate legacy sessions"));
    }
    if (entry.is_directory(ec)) continue;
    std::string name = entry.path().filename().string();
    if (!IsCandidate(name)) continue;

    const std::filesystem::path& path = entry.path();
    auto data_or = ReadWholeFile(path);
    if (!data_or.ok()) {
      LOG(WARNING) << "Skipping unreadable legacy session " << path << ": " << data_or.status().message();
      ++skipped;
      continue;
    }
    auto session_or = ParseLegacySession(*data_or);
    if (!session_or.ok()) {
      LOG(WARNING) << "Skipping invalid legacy session " << path << ": " << session_or.status().message();
      ++skipped;
      continue;
    }
    if (session_or->key.empty()) {
      LOG(WARNING) << "Skipping legacy session without key " << path;
      ++skipped;
      continue;
    }

    absl::Status status = ImportSession(*session_or, store, cancellation);
    if (!status.ok()) {
      if (absl::IsCancelled(status) || absl::IsDeadlineExceeded(status)) {
        return Annotate(status, absl::StrCat("import ", name));
      }
      LOG(WARNING) << "Failed to import legacy session " << path << ": " << status.message();
      ++skipped;
      continue;
    }

    std::filesystem::path backup = path;
    backup += kMigratedSuffix;
    std::filesystem::rename(path, backup, ec);
    if (ec) {
      LOG(WARNING) << "Imported " << path << " but could not rename it: " << ec.message()
                   << "; it will be checked again on the next run";
      continue;
    }
    ++migrated;
  }

  LOG(INFO) << "Migrated " << migrated << " legacy sessions from " << legacy_dir << " (" << skipped << " skipped)";
  return migrated;
}

}  // namespace convo
