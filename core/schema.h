#ifndef CONVO_CORE_SCHEMA_H_
#define CONVO_CORE_SCHEMA_H_

#include "absl/status/status.h"

#include "core/database.h"

namespace convo {

// Applies WAL journaling, the busy timeout, synchronous=NORMAL, foreign key
// enforcement and the page cache bound from `options`.
absl::Status ApplyPragmas(Database::Connection& conn, const Database::Options& options);

// Creates the sessions and messages tables if they do not exist yet.
absl::Status EnsureSchema(Database::Connection& conn);

}  // namespace convo

#endif  // CONVO_CORE_SCHEMA_H_
