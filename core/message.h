#ifndef CONVO_CORE_MESSAGE_H_
#define CONVO_CORE_MESSAGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include <nlohmann/json.hpp>

namespace convo {

struct FunctionCall {
  std::string name;
  // Raw JSON text as produced by the model.
  std::string arguments;
};

struct ToolCall {
  std::string id;
  std::string type;
  std::optional<FunctionCall> function;
  std::string name;
  // JSON object, or null when the call carries no parsed arguments.
  nlohmann::json arguments;
};

struct Message {
  std::string role;
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::string tool_call_id;

  // Assigned by the store; ignored on write.
  int64_t seq = 0;
  std::string created_at;
};

struct Session {
  std::string key;
  std::string summary;
  std::string created_at;
  std::string updated_at;
};

// Value of the string field `key`, or "" when it is absent or null.
std::string StringOrEmpty(const nlohmann::json& j, const char* key);

void to_json(nlohmann::json& j, const FunctionCall& f);
void from_json(const nlohmann::json& j, FunctionCall& f);
void to_json(nlohmann::json& j, const ToolCall& t);
void from_json(const nlohmann::json& j, ToolCall& t);
// Only role, content, tool_calls and tool_call_id are (de)serialized.
void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);

// Serialized form of the tool_calls_json column: nullopt for an empty list.
std::optional<std::string> EncodeToolCalls(const std::vector<ToolCall>& calls);

// Inverse of EncodeToolCalls. An absent or empty blob decodes to an empty
// list; malformed JSON is a DataLossError.
absl::StatusOr<std::vector<ToolCall>> DecodeToolCalls(const std::optional<std::string>& blob);

// RFC 3339 in UTC with millisecond precision, e.g. 2024-05-01T10:00:00.000Z.
std::string FormatTimestamp(absl::Time t);
std::string NowTimestamp();

// Accepts RFC 3339 with optional fractional seconds and any offset.
absl::StatusOr<absl::Time> ParseTimestamp(const std::string& text);

}  // namespace convo

#endif  // CONVO_CORE_MESSAGE_H_
