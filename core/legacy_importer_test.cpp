#include "core/legacy_importer.h"

#include <filesystem>
#include <fstream>
#include <string>

#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

namespace convo {
namespace {

class LegacyImporterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::path(::testing::TempDir()) /
            absl::StrCat("legacy_importer_test_", ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(root_);
    sessions_dir_ = root_ / "sessions";
    std::filesystem::create_directories(sessions_dir_);
    auto store_or = SessionStore::Open((root_ / "convo.db").string());
    ASSERT_TRUE(store_or.ok()) << store_or.status();
    store_ = std::move(*store_or);
  }

  void TearDown() override {
    store_.reset();
    std::filesystem::remove_all(root_);
  }

  void WriteFile(const std::string& name, const std::string& content) {
    std::ofstream out(sessions_dir_ / name);
    out << content;
  }

  void WriteSession(const std::string& file_name, const nlohmann::json& session) {
    WriteFile(file_name, session.dump());
  }

  bool Exists(const std::string& name) { return std::filesystem::exists(sessions_dir_ / name); }

  int Migrate() {
    auto count = MigrateLegacySessions(sessions_dir_.string(), store_.get());
    EXPECT_TRUE(count.ok()) << count.status();
    return count.ok() ? *count : -1;
  }

  std::filesystem::path root_;
  std::filesystem::path sessions_dir_;
  std::unique_ptr<SessionStore> store_;
};

TEST_F(LegacyImporterTest, ImportsMessagesAndSummary) {
  WriteSession("test.json", {{"key", "test"},
                             {"messages",
                              {{{"role", "user"}, {"content", "hello"}},
                               {{"role", "assistant"}, {"content", "hi there"}}}},
                             {"summary", "A greeting."},
                             {"created", "2024-05-01T10:00:00Z"},
                             {"updated", "2024-05-01T11:30:00.5+02:00"}});

  EXPECT_EQ(Migrate(), 1);

  auto history = store_->GetHistory("test");
  ASSERT_TRUE(history.ok()) << history.status();
  ASSERT_EQ(history->size(), 2);
  EXPECT_EQ((*history)[0].role, "user");
  EXPECT_EQ((*history)[0].content, "hello");
  EXPECT_EQ((*history)[0].seq, 1);
  EXPECT_EQ((*history)[1].content, "hi there");
  EXPECT_EQ((*history)[1].seq, 2);

  auto session = store_->GetSession("test");
  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->summary, "A greeting.");
  EXPECT_EQ(session->created_at, "2024-05-01T10:00:00.000Z");
  EXPECT_EQ(session->updated_at, "2024-05-01T09:30:00.500Z");
}

TEST_F(LegacyImporterTest, ImportsToolCalls) {
  WriteSession("tools.json",
               {{"key", "tools"},
                {"messages",
                 {{{"role", "user"}, {"content", "search"}},
                  {{"role", "assistant"},
                   {"content", ""},
                   {"tool_calls",
                    {{{"id", "call_1"},
                      {"type", "function"},
                      {"function", {{"name", "web_search"}, {"arguments", R"({"q":"test"})"}}}}}}},
                  {{"role", "tool"}, {"content", "result"}, {"tool_call_id", "call_1"}}}}});

  EXPECT_EQ(Migrate(), 1);

  auto history = store_->GetHistory("tools");
  ASSERT_TRUE(history.ok()) << history.status();
  ASSERT_EQ(history->size(), 3);
  ASSERT_EQ((*history)[1].tool_calls.size(), 1);
  const ToolCall& call = (*history)[1].tool_calls[0];
  EXPECT_EQ(call.id, "call_1");
  ASSERT_TRUE(call.function.has_value());
  EXPECT_EQ(call.function->name, "web_search");
  EXPECT_EQ(call.function->arguments, R"({"q":"test"})");
  EXPECT_EQ((*history)[2].tool_call_id, "call_1");
}

TEST_F(LegacyImporterTest, ImportsEveryFile) {
  for (int i = 0; i < 3; ++i) {
    std::string key = absl::StrCat("s", i);
    WriteSession(key + ".json", {{"key", key}, {"messages", {{{"role", "user"}, {"content", key}}}}});
  }
  EXPECT_EQ(Migrate(), 3);
  for (int i = 0; i < 3; ++i) {
    auto history = store_->GetHistory(absl::StrCat("s", i));
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 1);
    EXPECT_EQ((*history)[0].content, absl::StrCat("s", i));
  }
}

TEST_F(LegacyImporterTest, SkipsInvalidJson) {
  WriteFile("broken.json", "{not json");
  WriteFile("array.json", "[1, 2, 3]");
  WriteSession("good.json", {{"key", "good"}, {"messages", {{{"role", "user"}, {"content", "ok"}}}}});

  EXPECT_EQ(Migrate(), 1);
  EXPECT_TRUE(Exists("broken.json"));
  EXPECT_TRUE(Exists("array.json"));
  EXPECT_TRUE(Exists("good.json.migrated"));
  EXPECT_EQ(store_->GetHistory("good")->size(), 1);
}

TEST_F(LegacyImporterTest, RenamesImportedFiles) {
  WriteSession("rename.json", {{"key", "rename"}, {"messages", {{{"role", "user"}, {"content", "x"}}}}});
  EXPECT_EQ(Migrate(), 1);
  EXPECT_FALSE(Exists("rename.json"));
  EXPECT_TRUE(Exists("rename.json.migrated"));
}

TEST_F(LegacyImporterTest, SecondRunIsNoOp) {
  WriteSession("once.json", {{"key", "once"}, {"messages", {{{"role", "user"}, {"content", "x"}}}}});
  EXPECT_EQ(Migrate(), 1);
  EXPECT_EQ(Migrate(), 0);
  EXPECT_EQ(store_->GetHistory("once")->size(), 1);
}

TEST_F(LegacyImporterTest, FailedRenameIsRetriedOnNextRun) {
  WriteSession("stuck.json",
               {{"key", "stuck"},
                {"messages", {{{"role", "user"}, {"content", "a"}}, {{"role", "user"}, {"content", "b"}}}}});
  // A non-empty directory in the way makes the rename fail after the commit.
  std::filesystem::create_directories(sessions_dir_ / "stuck.json.migrated");
  WriteFile("stuck.json.migrated/occupied", "x");

  EXPECT_EQ(Migrate(), 0);
  EXPECT_TRUE(Exists("stuck.json"));
  ASSERT_EQ(store_->GetHistory("stuck")->size(), 2);

  std::filesystem::remove_all(sessions_dir_ / "stuck.json.migrated");
  EXPECT_EQ(Migrate(), 1);
  EXPECT_FALSE(Exists("stuck.json"));
  EXPECT_TRUE(Exists("stuck.json.migrated"));

  auto history = store_->GetHistory("stuck");
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history->size(), 2);
  EXPECT_EQ((*history)[0].content, "a");
  EXPECT_EQ((*history)[1].content, "b");
}

TEST_F(LegacyImporterTest, FailingFileIsImportedAllOrNothing) {
  ASSERT_TRUE(store_->database()
                  ->Run(nullptr,
                        [](Database::Connection& conn) {
                          return conn.ExecuteScript(
                              "CREATE TRIGGER reject_second BEFORE INSERT ON messages "
                              "WHEN NEW.session_key = 'bad' AND NEW.seq = 2 "
                              "BEGIN SELECT RAISE(ABORT, 'rejected'); END;");
                        })
                  .ok());
  WriteSession("bad.json", {{"key", "bad"},
                            {"summary", "never stored"},
                            {"messages",
                             {{{"role", "user"}, {"content", "1"}},
                              {{"role", "user"}, {"content", "2"}},
                              {{"role", "user"}, {"content", "3"}}}}});
  WriteSession("good.json", {{"key", "good"}, {"messages", {{{"role", "user"}, {"content", "ok"}}}}});

  EXPECT_EQ(Migrate(), 1);
  EXPECT_EQ(store_->GetSession("bad").status().code(), absl::StatusCode::kNotFound);
  EXPECT_TRUE(store_->GetHistory("bad")->empty());
  EXPECT_TRUE(Exists("bad.json"));
  EXPECT_FALSE(Exists("bad.json.migrated"));
  EXPECT_EQ(store_->GetHistory("good")->size(), 1);
  EXPECT_TRUE(Exists("good.json.migrated"));
}

TEST_F(LegacyImporterTest, NullContentIsImportedAsEmpty) {
  WriteFile("nulls.json",
            R"({"key":"nulls","summary":null,"created":null,"messages":[)"
            R"({"role":"assistant","content":null,"tool_calls":[{"id":"c1","type":"function",)"
            R"("function":{"name":"f","arguments":"{}"}}]}]})");
  EXPECT_EQ(Migrate(), 1);
  auto history = store_->GetHistory("nulls");
  ASSERT_TRUE(history.ok()) << history.status();
  ASSERT_EQ(history->size(), 1);
  EXPECT_EQ((*history)[0].content, "");
  ASSERT_EQ((*history)[0].tool_calls.size(), 1);
  EXPECT_EQ((*history)[0].tool_calls[0].id, "c1");
}

TEST_F(LegacyImporterTest, UsesKeyFromFileNotFileName) {
  WriteSession("telegram_123.json",
               {{"key", "telegram:123"}, {"messages", {{{"role", "user"}, {"content", "from telegram"}}}}});
  EXPECT_EQ(Migrate(), 1);

  auto history = store_->GetHistory("telegram:123");
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history->size(), 1);
  EXPECT_EQ((*history)[0].content, "from telegram");
  EXPECT_TRUE(store_->GetHistory("telegram_123")->empty());
}

TEST_F(LegacyImporterTest, MissingDirectoryImportsNothing) {
  auto count = MigrateLegacySessions((root_ / "does_not_exist").string(), store_.get());
  ASSERT_TRUE(count.ok()) << count.status();
  EXPECT_EQ(*count, 0);
}

TEST_F(LegacyImporterTest, NullStoreIsRejected) {
  EXPECT_EQ(MigrateLegacySessions(sessions_dir_.string(), nullptr).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(LegacyImporterTest, ExistingHistoryIsNotOverwritten) {
  ASSERT_TRUE(store_->AddMessage("existing", "user", "already here").ok());
  WriteSession("existing.json",
               {{"key", "existing"},
                {"summary", "from file"},
                {"messages", {{{"role", "user"}, {"content", "a"}}, {{"role", "assistant"}, {"content", "b"}}}}});

  EXPECT_EQ(Migrate(), 1);
  auto history = store_->GetHistory("existing");
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history->size(), 1);
  EXPECT_EQ((*history)[0].content, "already here");
  EXPECT_EQ(*store_->GetSummary("existing"), "");
  EXPECT_TRUE(Exists("existing.json.migrated"));
}

TEST_F(LegacyImporterTest, SkipsFilesWithoutKey) {
  WriteSession("nokey.json", {{"messages", {{{"role", "user"}, {"content", "orphan"}}}}});
  WriteSession("emptykey.json", {{"key", ""}, {"messages", nlohmann::json::array()}});
  EXPECT_EQ(Migrate(), 0);
  EXPECT_TRUE(Exists("nokey.json"));
  EXPECT_TRUE(Exists("emptykey.json"));
}

TEST_F(LegacyImporterTest, IgnoresMigratedAndForeignFiles) {
  WriteSession("old.json.migrated", {{"key", "old"}, {"messages", {{{"role", "user"}, {"content", "x"}}}}});
  WriteFile("notes.txt", "not a session");
  EXPECT_EQ(Migrate(), 0);
  EXPECT_TRUE(store_->GetHistory("old")->empty());
  EXPECT_TRUE(Exists("notes.txt"));
}

TEST_F(LegacyImporterTest, IgnoresDirectories) {
  std::filesystem::create_directories(sessions_dir_ / "nested.json");
  WriteSession("real.json", {{"key", "real"}, {"messages", {{{"role", "user"}, {"content", "x"}}}}});
  EXPECT_EQ(Migrate(), 1);
  EXPECT_TRUE(std::filesystem::is_directory(sessions_dir_ / "nested.json"));
}

TEST_F(LegacyImporterTest, SessionWithoutMessagesStillGetsSummary) {
  WriteSession("quiet.json", {{"key", "quiet"}, {"summary", "nothing said"}, {"messages", nullptr}});
  EXPECT_EQ(Migrate(), 1);
  auto session = store_->GetSession("quiet");
  ASSERT_TRUE(session.ok()) << session.status();
  EXPECT_EQ(session->summary, "nothing said");
  EXPECT_TRUE(store_->GetHistory("quiet")->empty());
}

TEST_F(LegacyImporterTest, CancelledRunStopsBeforeImporting) {
  WriteSession("a.json", {{"key", "a"}, {"messages", {{{"role", "user"}, {"content", "x"}}}}});
  auto cancellation = std::make_shared<CancellationRequest>();
  cancellation->Cancel();

  auto count = MigrateLegacySessions(sessions_dir_.string(), store_.get(), cancellation);
  EXPECT_EQ(count.status().code(), absl::StatusCode::kCancelled);
  EXPECT_TRUE(Exists("a.json"));
  EXPECT_TRUE(store_->GetHistory("a")->empty());
}

TEST(ParseLegacySessionTest, RejectsNonObjects) {
  EXPECT_EQ(ParseLegacySession("42").status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ParseLegacySession("").status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParseLegacySessionTest, DefaultsMissingFields) {
  auto session = ParseLegacySession(R"({"key":"k"})");
  ASSERT_TRUE(session.ok()) << session.status();
  EXPECT_EQ(session->key, "k");
  EXPECT_TRUE(session->messages.empty());
  EXPECT_EQ(session->summary, "");
  EXPECT_EQ(session->created, "");
}

}  // namespace
}  // namespace convo
