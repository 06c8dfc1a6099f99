#ifndef CONVO_CORE_CANCELLATION_H_
#define CONVO_CORE_CANCELLATION_H_

#include <functional>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace convo {

// Cancellable, deadline-bearing context for a single operation. Shared between
// the caller and the operation through std::shared_ptr; a null pointer means
// the operation runs without a context.
class CancellationRequest {
 public:
  CancellationRequest() = default;

  // Creates a request whose deadline is `timeout` from now.
  static std::shared_ptr<CancellationRequest> WithTimeout(absl::Duration timeout);

  // Trigger cancellation and run all registered callbacks.
  void Cancel();

  // Returns true if cancellation has been requested.
  bool IsCancelled() const;

  // Registers a callback to be run when Cancel() is called.
  // If Cancel() has already been called, the callback is run immediately.
  void RegisterCallback(std::function<void()> cb);

  void SetDeadline(absl::Time deadline);
  absl::Time deadline() const;
  bool DeadlineExceeded() const;

  // CancelledError, DeadlineExceededError or OK, in that order of precedence.
  absl::Status ToStatus() const;

 private:
  mutable absl::Mutex mu_;
  bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
  absl::Time deadline_ ABSL_GUARDED_BY(mu_) = absl::InfiniteFuture();
  std::vector<std::function<void()>> callbacks_ ABSL_GUARDED_BY(mu_);
};

}  // namespace convo

#endif  // CONVO_CORE_CANCELLATION_H_
