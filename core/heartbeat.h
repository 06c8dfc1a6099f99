#ifndef CONVO_CORE_HEARTBEAT_H_
#define CONVO_CORE_HEARTBEAT_H_

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace convo {

// What the external handler did with a heartbeat prompt.
struct HeartbeatOutcome {
  enum class Kind {
    kCompleted,  // finished, `message` is the reply
    kAsync,      // started a background task described by `message`
    kError,      // failed, `message` describes the error
  };

  Kind kind = Kind::kCompleted;
  std::string message;

  static HeartbeatOutcome Completed(std::string message) { return {Kind::kCompleted, std::move(message)}; }
  static HeartbeatOutcome Async(std::string message) { return {Kind::kAsync, std::move(message)}; }
  static HeartbeatOutcome Error(std::string message) { return {Kind::kError, std::move(message)}; }
};

using HeartbeatHandler = std::function<HeartbeatOutcome(const std::string& prompt)>;

/**
 * @brief Periodically builds a heartbeat prompt and hands it to a handler.
 *
 * The prompt includes the current time and the workspace's
 * memory/HEARTBEAT.md notes. Outcomes are logged and appended to
 * memory/heartbeat.log in the workspace.
 */
class HeartbeatService {
 public:
  HeartbeatService(std::string workspace, absl::Duration interval, bool enabled);
  ~HeartbeatService();

  HeartbeatService(const HeartbeatService&) = delete;
  HeartbeatService& operator=(const HeartbeatService&) = delete;

  void SetHandler(HeartbeatHandler handler);

  // FailedPreconditionError when the service is disabled. Starting a running
  // service is a no-op.
  absl::Status Start();

  // Wakes and joins the worker thread. Safe to call more than once, and from
  // the handler itself; a worker that stops itself is joined on the next
  // Start() or on destruction.
  void Stop();

  bool IsRunning() const;

  // Builds the prompt and delivers it once on the calling thread.
  void ExecuteHeartbeat();

  std::string BuildPrompt() const;

 private:
  void RunLoop(std::shared_ptr<absl::Notification> stop);
  void AppendLog(const std::string& message);

  const std::string workspace_;
  const absl::Duration interval_;
  const bool enabled_;

  mutable absl::Mutex mu_;
  HeartbeatHandler handler_ ABSL_GUARDED_BY(mu_);
  bool running_ ABSL_GUARDED_BY(mu_) = false;
  // Each worker owns its stop signal, so a Start() racing a Stop() can never
  // re-arm a worker that is being joined.
  std::shared_ptr<absl::Notification> stop_ ABSL_GUARDED_BY(mu_);
  std::thread worker_ ABSL_GUARDED_BY(mu_);
  std::vector<std::thread> retired_ ABSL_GUARDED_BY(mu_);

  absl::Mutex log_mu_;
};

}  // namespace convo

#endif  // CONVO_CORE_HEARTBEAT_H_
