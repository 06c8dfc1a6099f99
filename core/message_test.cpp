#include "core/message.h"

#include "absl/time/clock.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

namespace convo {
namespace {

ToolCall SearchCall() {
  ToolCall call;
  call.id = "call_1";
  call.type = "function";
  call.function = FunctionCall{"web_search", R"({"q":"test"})"};
  return call;
}

TEST(MessageTest, EncodeEmptyToolCallsIsAbsent) { EXPECT_FALSE(EncodeToolCalls({}).has_value()); }

TEST(MessageTest, ToolCallsRoundTripInOrder) {
  ToolCall second;
  second.id = "call_2";
  second.type = "function";
  second.name = "read_file";
  second.arguments = {{"path", "/tmp/a.txt"}, {"start_line", 3}};

  auto blob = EncodeToolCalls({SearchCall(), second});
  ASSERT_TRUE(blob.has_value());

  auto decoded = DecodeToolCalls(blob);
  ASSERT_TRUE(decoded.ok()) << decoded.status();
  ASSERT_EQ(decoded->size(), 2);

  EXPECT_EQ((*decoded)[0].id, "call_1");
  EXPECT_EQ((*decoded)[0].type, "function");
  ASSERT_TRUE((*decoded)[0].function.has_value());
  EXPECT_EQ((*decoded)[0].function->name, "web_search");
  EXPECT_EQ((*decoded)[0].function->arguments, R"({"q":"test"})");
  EXPECT_TRUE((*decoded)[0].arguments.is_null());

  EXPECT_EQ((*decoded)[1].id, "call_2");
  EXPECT_EQ((*decoded)[1].name, "read_file");
  EXPECT_FALSE((*decoded)[1].function.has_value());
  EXPECT_EQ((*decoded)[1].arguments["path"], "/tmp/a.txt");
  EXPECT_EQ((*decoded)[1].arguments["start_line"], 3);
}

TEST(MessageTest, ToolCallOmitsEmptyFields) {
  ToolCall call;
  call.id = "c";
  nlohmann::json j = call;
  EXPECT_EQ(j.dump(), R"({"id":"c"})");
}

TEST(MessageTest, DecodeAbsentOrEmptyBlob) {
  auto absent = DecodeToolCalls(std::nullopt);
  ASSERT_TRUE(absent.ok());
  EXPECT_TRUE(absent->empty());

  auto empty = DecodeToolCalls(std::string());
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty->empty());
}

TEST(MessageTest, DecodeMalformedBlobIsDataLoss) {
  auto decoded = DecodeToolCalls(std::string("[{\"id\":"));
  EXPECT_EQ(decoded.status().code(), absl::StatusCode::kDataLoss);
}

TEST(MessageTest, MessageFromLegacyJson) {
  auto j = nlohmann::json::parse(R"({
    "role": "assistant",
    "content": "Searching...",
    "tool_calls": [{"id": "call_1", "type": "function",
                    "function": {"name": "web_search", "arguments": "{\"q\":\"test\"}"}}]
  })");
  Message msg = j.get<Message>();
  EXPECT_EQ(msg.role, "assistant");
  EXPECT_EQ(msg.content, "Searching...");
  EXPECT_EQ(msg.tool_call_id, "");
  ASSERT_EQ(msg.tool_calls.size(), 1);
  EXPECT_EQ(msg.tool_calls[0].function->name, "web_search");
}

TEST(MessageTest, NullStringFieldsDecodeAsEmpty) {
  auto j = nlohmann::json::parse(
      R"({"role":"assistant","content":null,"tool_call_id":null,)"
      R"("tool_calls":[{"id":"c1","type":null,"function":{"name":"f","arguments":null}}]})");
  Message msg = j.get<Message>();
  EXPECT_EQ(msg.role, "assistant");
  EXPECT_EQ(msg.content, "");
  EXPECT_EQ(msg.tool_call_id, "");
  ASSERT_EQ(msg.tool_calls.size(), 1);
  EXPECT_EQ(msg.tool_calls[0].type, "");
  ASSERT_TRUE(msg.tool_calls[0].function.has_value());
  EXPECT_EQ(msg.tool_calls[0].function->arguments, "");
}

TEST(MessageTest, MessageToJsonSkipsStoreFields) {
  Message msg;
  msg.role = "tool";
  msg.content = "result";
  msg.tool_call_id = "call_1";
  msg.seq = 7;
  msg.created_at = "2024-01-01T00:00:00.000Z";
  nlohmann::json j = msg;
  EXPECT_EQ(j, nlohmann::json::parse(R"({"role":"tool","content":"result","tool_call_id":"call_1"})"));
}

TEST(MessageTest, TimestampFormat) {
  absl::Time t = absl::FromUnixMillis(1714557600123);
  EXPECT_EQ(FormatTimestamp(t), "2024-05-01T10:00:00.123Z");
}

TEST(MessageTest, ParseTimestampAcceptsOffsetsAndFractions) {
  auto zulu = ParseTimestamp("2024-05-01T10:00:00Z");
  ASSERT_TRUE(zulu.ok()) << zulu.status();
  EXPECT_EQ(absl::ToUnixSeconds(*zulu), 1714557600);

  auto offset = ParseTimestamp("2024-05-01T12:00:00.123456789+02:00");
  ASSERT_TRUE(offset.ok()) << offset.status();
  EXPECT_EQ(absl::ToUnixSeconds(*offset), 1714557600);

  EXPECT_FALSE(ParseTimestamp("yesterday").ok());
}

}  // namespace
}  // namespace convo
