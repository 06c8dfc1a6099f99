#include "core/cancellation.h"

#include "absl/time/clock.h"

namespace convo {

std::shared_ptr<CancellationRequest> CancellationRequest::WithTimeout(absl::Duration timeout) {
  auto request = std::make_shared<CancellationRequest>();
  request->SetDeadline(absl::Now() + timeout);
  return request;
}

void CancellationRequest::Cancel() {
  std::vector<std::function<void()>> to_run;
  {
    absl::MutexLock lock(&mu_);
    if (cancelled_) return;
    cancelled_ = true;
    to_run.swap(callbacks_);
  }
  for (auto& cb : to_run) {
    cb();
  }
}

bool CancellationRequest::IsCancelled() const {
  absl::ReaderMutexLock lock(&mu_);
  return cancelled_;
}

void CancellationRequest::RegisterCallback(std::function<void()> cb) {
  bool already_cancelled = false;
  {
    absl::MutexLock lock(&mu_);
    if (cancelled_) {
      already_cancelled = true;
    } else {
      callbacks_.push_back(std::move(cb));
    }
  }
  if (already_cancelled) {
    cb();
  }
}

void CancellationRequest::SetDeadline(absl::Time deadline) {
  absl::MutexLock lock(&mu_);
  deadline_ = deadline;
}

absl::Time CancellationRequest::deadline() const {
  absl::ReaderMutexLock lock(&mu_);
  return deadline_;
}

bool CancellationRequest::DeadlineExceeded() const {
  absl::ReaderMutexLock lock(&mu_);
  return deadline_ != absl::InfiniteFuture() && absl::Now() >= deadline_;
}

absl::Status CancellationRequest::ToStatus() const {
  if (IsCancelled()) return absl::CancelledError("operation cancelled");
  if (DeadlineExceeded()) return absl::DeadlineExceededError("operation deadline exceeded");
  return absl::OkStatus();
}

}  // namespace convo
