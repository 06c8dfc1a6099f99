#ifndef CONVO_CORE_STATUS_MACROS_H_
#define CONVO_CORE_STATUS_MACROS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

#define RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

#define ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                          \
  if (!status_or.ok()) return status_or.status();    \
  lhs = std::move(*status_or)

#define CONCAT_IMPL(x, y) x##y
#define CONCAT(x, y) CONCAT_IMPL(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) ASSIGN_OR_RETURN_IMPL(CONCAT(_status_or, __LINE__), lhs, rexpr)

namespace convo {

// Returns `status` with `context` prepended to its message. The code is kept.
inline absl::Status Annotate(const absl::Status& status, absl::string_view context) {
  if (status.ok()) return status;
  return absl::Status(status.code(), absl::StrCat(context, ": ", status.message()));
}

template <typename T>
absl::StatusOr<T> Annotate(absl::StatusOr<T> status_or, absl::string_view context) {
  if (status_or.ok()) return status_or;
  return Annotate(status_or.status(), context);
}

}  // namespace convo

#endif  // CONVO_CORE_STATUS_MACROS_H_
