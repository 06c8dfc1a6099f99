#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

#include "core/cancellation.h"
#include "core/constants.h"
#include "core/legacy_importer.h"
#include "core/session_store.h"
#include "core/status_macros.h"

#include <nlohmann/json.hpp>

ABSL_FLAG(std::string, db, "", "Path to the SQLite database (default: $CONVO_DB or convo.db)");
ABSL_FLAG(std::string, sessions_dir, "", "Directory of legacy JSON session files (default: $CONVO_SESSIONS_DIR)");
ABSL_FLAG(std::string, log, "", "Log file path");
ABSL_FLAG(bool, migrate_on_open, true, "Import legacy sessions from --sessions_dir after opening the store");
ABSL_FLAG(int, busy_timeout_ms, convo::kDefaultBusyTimeoutMs, "SQLite busy timeout in milliseconds");
ABSL_FLAG(int, cache_size_kib, convo::kDefaultCacheSizeKib, "SQLite page cache bound in KiB");
ABSL_FLAG(absl::Duration, timeout, absl::InfiniteDuration(), "Deadline for each store operation");

namespace {

constexpr char kUsage[] =
    "convo - persistent conversation store\n\n"
    "Usage: convo [flags] <command> [args...]\n\n"
    "Commands:\n"
    "  migrate                         Import legacy sessions from --sessions_dir\n"
    "  history <key>                   Print the session history as JSON\n"
    "  summary <key> [text]            Print or set the session summary\n"
    "  append <key> <role> <content>   Append a message\n"
    "  truncate <key> <keep_last>      Keep only the most recent messages\n";

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
};

std::string FlagOrEnv(const std::string& flag_value, const char* env_name, const std::string& fallback) {
  if (!flag_value.empty()) return flag_value;
  const char* env = std::getenv(env_name);
  if (env != nullptr && *env != '\0') return env;
  return fallback;
}

std::shared_ptr<convo::CancellationRequest> NewContext() {
  absl::Duration timeout = absl::GetFlag(FLAGS_timeout);
  if (timeout == absl::InfiniteDuration()) return nullptr;
  return convo::CancellationRequest::WithTimeout(timeout);
}

absl::Status RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
  if (args.size() < count) {
    return absl::InvalidArgumentError(absl::StrCat("usage: convo ", usage));
  }
  return absl::OkStatus();
}

absl::Status RunMigration(convo::SessionStore* store, const std::string& sessions_dir) {
  if (sessions_dir.empty()) {
    return absl::InvalidArgumentError("--sessions_dir is not set");
  }
  ASSIGN_OR_RETURN(int count, convo::MigrateLegacySessions(sessions_dir, store, NewContext()));
  std::cout << "Migrated " << count << " sessions" << std::endl;
  return absl::OkStatus();
}

absl::Status RunCommand(convo::SessionStore* store, const std::vector<std::string>& args,
                        const std::string& sessions_dir) {
  const std::string& command = args[0];

  if (command == "migrate") {
    return RunMigration(store, sessions_dir);
  }

  if (command == "history") {
    RETURN_IF_ERROR(RequireArgs(args, 2, "history <key>"));
    ASSIGN_OR_RETURN(auto history, store->GetHistory(args[1], NewContext()));
    nlohmann::json out = nlohmann::json::array();
    for (const auto& msg : history) {
      nlohmann::json j = msg;
      j["seq"] = msg.seq;
      j["created_at"] = msg.created_at;
      out.push_back(std::move(j));
    }
    std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return absl::OkStatus();
  }

  if (command == "summary") {
    RETURN_IF_ERROR(RequireArgs(args, 2, "summary <key> [text]"));
    if (args.size() >= 3) {
      return store->SetSummary(args[1], args[2], NewContext());
    }
    ASSIGN_OR_RETURN(std::string summary, store->GetSummary(args[1], NewContext()));
    std::cout << summary << std::endl;
    return absl::OkStatus();
  }

  if (command == "append") {
    RETURN_IF_ERROR(RequireArgs(args, 4, "append <key> <role> <content>"));
    return store->AddMessage(args[1], args[2], args[3], NewContext());
  }

  if (command == "truncate") {
    RETURN_IF_ERROR(RequireArgs(args, 3, "truncate <key> <keep_last>"));
    int keep_last = 0;
    if (!absl::SimpleAtoi(args[2], &keep_last)) {
      return absl::InvalidArgumentError(absl::StrCat("keep_last must be an integer, got '", args[2], "'"));
    }
    return store->TruncateHistory(args[1], keep_last, NewContext());
  }

  return absl::InvalidArgumentError(absl::StrCat("unknown command '", command, "'"));
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(kUsage);
  std::vector<char*> positional_args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<FileLogSink> log_sink;
  if (!log_path.empty()) {
    log_sink = std::make_unique<FileLogSink>(log_path);
    absl::AddLogSink(log_sink.get());
  }

  std::vector<std::string> args(positional_args.begin() + 1, positional_args.end());
  if (args.empty()) {
    std::cerr << kUsage;
    return 1;
  }

  std::string db_path = FlagOrEnv(absl::GetFlag(FLAGS_db), "CONVO_DB", "convo.db");
  std::string sessions_dir = FlagOrEnv(absl::GetFlag(FLAGS_sessions_dir), "CONVO_SESSIONS_DIR", "");

  convo::Database::Options options;
  options.busy_timeout_ms = absl::GetFlag(FLAGS_busy_timeout_ms);
  options.cache_size_kib = absl::GetFlag(FLAGS_cache_size_kib);

  auto store_or = convo::SessionStore::Open(db_path, options, NewContext());
  if (!store_or.ok()) {
    LOG(ERROR) << "Failed to open store: " << store_or.status().message();
    std::cerr << "Database Error: " << store_or.status().message() << std::endl;
    return 1;
  }
  auto store = std::move(*store_or);

  if (absl::GetFlag(FLAGS_migrate_on_open) && !sessions_dir.empty() && args[0] != "migrate") {
    auto migrated_or = convo::MigrateLegacySessions(sessions_dir, store.get(), NewContext());
    if (!migrated_or.ok()) {
      LOG(ERROR) << "Legacy migration failed: " << migrated_or.status().message();
      std::cerr << "Migration Error: " << migrated_or.status().message() << std::endl;
      return 1;
    }
  }

  absl::Status status = RunCommand(store.get(), args, sessions_dir);
  store->Close();
  if (log_sink) {
    absl::RemoveLogSink(log_sink.get());
  }
  if (!status.ok()) {
    std::cerr << "Error: " << status.message() << std::endl;
    return 1;
  }
  return 0;
}
