#include "core/heartbeat.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/substitute.h"
#include "absl/time/clock.h"

#include "core/constants.h"

namespace convo {

HeartbeatService::HeartbeatService(std::string workspace, absl::Duration interval, bool enabled)
    : workspace_(std::move(workspace)), interval_(interval), enabled_(enabled) {}

HeartbeatService::~HeartbeatService() {
  Stop();
  std::vector<std::thread> leftovers;
  {
    absl::MutexLock lock(&mu_);
    leftovers = std::move(retired_);
    if (worker_.joinable()) leftovers.push_back(std::move(worker_));
  }
  for (auto& t : leftovers) t.join();
}

void HeartbeatService::SetHandler(HeartbeatHandler handler) {
  absl::MutexLock lock(&mu_);
  handler_ = std::move(handler);
}

absl::Status HeartbeatService::Start() {
  absl::MutexLock lock(&mu_);
  if (running_) return absl::OkStatus();
  if (!enabled_) {
    return absl::FailedPreconditionError("heartbeat service is disabled");
  }
  // A worker that stopped itself from its handler is still attached here.
  if (worker_.joinable()) {
    retired_.push_back(std::move(worker_));
  }
  stop_ = std::make_shared<absl::Notification>();
  running_ = true;
  worker_ = std::thread(&HeartbeatService::RunLoop, this, stop_);
  LOG(INFO) << "Heartbeat service started (interval " << interval_ << ")";
  return absl::OkStatus();
}

void HeartbeatService::Stop() {
  std::shared_ptr<absl::Notification> stop;
  std::thread worker;
  {
    absl::MutexLock lock(&mu_);
    if (!running_) return;
    running_ = false;
    stop = std::move(stop_);
    if (worker_.get_id() != std::this_thread::get_id()) {
      worker = std::move(worker_);
    }
  }
  stop->Notify();
  if (worker.joinable()) {
    worker.join();
    LOG(INFO) << "Heartbeat service stopped";
  } else {
    LOG(INFO) << "Heartbeat service stopping from its own handler";
  }
}

bool HeartbeatService::IsRunning() const {
  absl::MutexLock lock(&mu_);
  return running_;
}

void HeartbeatService::RunLoop(std::shared_ptr<absl::Notification> stop) {
  while (!stop->WaitForNotificationWithTimeout(interval_)) {
    ExecuteHeartbeat();
  }
}

void HeartbeatService::ExecuteHeartbeat() {
  HeartbeatHandler handler;
  {
    absl::MutexLock lock(&mu_);
    handler = handler_;
  }
  if (!handler) {
    LOG(WARNING) << "Heartbeat fired without a handler";
    AppendLog("Heartbeat handler not set");
    return;
  }

  HeartbeatOutcome outcome = handler(BuildPrompt());
  switch (outcome.kind) {
    case HeartbeatOutcome::Kind::kError:
      LOG(WARNING) << "Heartbeat error: " << outcome.message;
      AppendLog("Heartbeat error: " + outcome.message);
      break;
    case HeartbeatOutcome::Kind::kAsync:
      LOG(INFO) << "Async heartbeat task started: " << outcome.message;
      AppendLog("Async task started: " + outcome.message);
      break;
    case HeartbeatOutcome::Kind::kCompleted:
      LOG(INFO) << "Heartbeat completed";
      AppendLog("Heartbeat completed: " + outcome.message);
      break;
  }
}

std::string HeartbeatService::BuildPrompt() const {
  std::string notes;
  std::ifstream file(std::filesystem::path(workspace_) / kHeartbeatNotesFile);
  if (file.is_open()) {
    std::stringstream buffer;
    buffer << file.rdbuf();
    notes = buffer.str();
  }

  std::string now = absl::FormatTime("%Y-%m-%d %H:%M", absl::Now(), absl::LocalTimeZone());
  return absl::Substitute(
      "# Heartbeat Check\n\n"
      "Current time: $0\n\n"
      "Check if there are any tasks I should be aware of or actions I should take.\n"
      "Review the memory file for any important updates or changes.\n"
      "Be proactive in identifying potential issues or improvements.\n\n"
      "$1\n",
      now, notes);
}

void HeartbeatService::AppendLog(const std::string& message) {
  std::filesystem::path path = std::filesystem::path(workspace_) / kHeartbeatLogFile;
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    LOG(WARNING) << "Cannot create heartbeat log directory: " << ec.message();
    return;
  }

  absl::MutexLock lock(&log_mu_);
  std::ofstream stream(path, std::ios::app);
  if (!stream.is_open()) {
    LOG(WARNING) << "Cannot open heartbeat log " << path;
    return;
  }
  stream << "[" << absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::Now(), absl::LocalTimeZone()) << "] " << message
         << "\n";
}

}  // namespace convo
