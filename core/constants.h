#ifndef CONVO_CORE_CONSTANTS_H_
#define CONVO_CORE_CONSTANTS_H_

namespace convo {

// SQLite tuning applied on open
constexpr int kDefaultBusyTimeoutMs = 5000;
constexpr int kDefaultCacheSizeKib = 512;
// Progress handler granularity, in VM instructions.
constexpr int kProgressHandlerOps = 1000;

// Legacy session files
constexpr char kLegacySessionSuffix[] = ".json";
constexpr char kMigratedSuffix[] = ".migrated";

// Heartbeat
constexpr char kHeartbeatNotesFile[] = "memory/HEARTBEAT.md";
constexpr char kHeartbeatLogFile[] = "memory/heartbeat.log";
constexpr int kDefaultHeartbeatIntervalSeconds = 30 * 60;

}  // namespace convo

#endif  // CONVO_CORE_CONSTANTS_H_
