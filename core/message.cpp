#include "core/message.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

namespace convo {

std::string StringOrEmpty(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return "";
  return it->get<std::string>();
}

void to_json(nlohmann::json& j, const FunctionCall& f) {
  j = nlohmann::json{{"name", f.name}, {"arguments", f.arguments}};
}

void from_json(const nlohmann::json& j, FunctionCall& f) {
  f.name = StringOrEmpty(j, "name");
  f.arguments = StringOrEmpty(j, "arguments");
}

void to_json(nlohmann::json& j, const ToolCall& t) {
  j = nlohmann::json{{"id", t.id}};
  if (!t.type.empty()) j["type"] = t.type;
  if (t.function.has_value()) j["function"] = *t.function;
  if (!t.name.empty()) j["name"] = t.name;
  if (!t.arguments.is_null() && !t.arguments.empty()) j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, ToolCall& t) {
  t.id = StringOrEmpty(j, "id");
  t.type = StringOrEmpty(j, "type");
  if (j.contains("function") && !j.at("function").is_null()) {
    t.function = j.at("function").get<FunctionCall>();
  } else {
    t.function.reset();
  }
  t.name = StringOrEmpty(j, "name");
  if (j.contains("arguments") && !j.at("arguments").is_null()) {
    t.arguments = j.at("arguments");
  } else {
    t.arguments = nullptr;
  }
}

void to_json(nlohmann::json& j, const Message& m) {
  j = nlohmann::json{{"role", m.role}, {"content", m.content}};
  if (!m.tool_calls.empty()) j["tool_calls"] = m.tool_calls;
  if (!m.tool_call_id.empty()) j["tool_call_id"] = m.tool_call_id;
}

void from_json(const nlohmann::json& j, Message& m) {
  m.role = StringOrEmpty(j, "role");
  m.content = StringOrEmpty(j, "content");
  m.tool_calls.clear();
  if (j.contains("tool_calls") && !j.at("tool_calls").is_null()) {
    m.tool_calls = j.at("tool_calls").get<std::vector<ToolCall>>();
  }
  m.tool_call_id = StringOrEmpty(j, "tool_call_id");
}

std::optional<std::string> EncodeToolCalls(const std::vector<ToolCall>& calls) {
  if (calls.empty()) return std::nullopt;
  nlohmann::json j = calls;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

absl::StatusOr<std::vector<ToolCall>> DecodeToolCalls(const std::optional<std::string>& blob) {
  if (!blob.has_value() || blob->empty()) return std::vector<ToolCall>{};
  try {
    return nlohmann::json::parse(*blob).get<std::vector<ToolCall>>();
  } catch (const nlohmann::json::exception& e) {
    return absl::DataLossError(absl::StrCat("decode tool calls: ", e.what()));
  }
}

std::string FormatTimestamp(absl::Time t) {
  return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", t, absl::UTCTimeZone());
}

std::string NowTimestamp() { return FormatTimestamp(absl::Now()); }

absl::StatusOr<absl::Time> ParseTimestamp(const std::string& text) {
  absl::Time t;
  std::string err;
  if (!absl::ParseTime(absl::RFC3339_full, text, &t, &err)) {
    return absl::InvalidArgumentError(absl::StrCat("parse timestamp \"", text, "\": ", err));
  }
  return t;
}

}  // namespace convo
