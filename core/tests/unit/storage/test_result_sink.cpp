// tests/unit/storage/test_result_sink.cpp - JSON Lines result store

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "callscope/analysis/call_graph_explorer.hpp"
#include "callscope/storage/result_sink.hpp"
#include "callscope/test_support/program_helpers.hpp"

using namespace callscope;
using test_support::call;
using test_support::ProgramBuilder;
using test_support::TempDir;

namespace
{

std::vector<nlohmann::json> read_lines(const std::filesystem::path & path)
{
  std::vector<nlohmann::json> out;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      out.push_back(nlohmann::json::parse(line));
    }
  }
  return out;
}

}  // namespace

TEST(StorageJsonLines, WritesOneRecordPerLine)
{
  auto program = ProgramBuilder()
                   .klass("a.A")
                   .method("main", {call("a.A", "helper"), call("x.Y", "ext")})
                   .method("helper", {})
                   .build();
  CallGraphExplorer explorer(*program);
  const CallTreeNode tree = explorer.explore("a.A", "main");

  TempDir dir("sink_write");
  const auto path = dir.path() / "out" / "calls.jsonl";

  SinkStatus status;
  auto sink = JsonLinesSink::open(path, status);
  ASSERT_NE(sink, nullptr) << status.error;
  EXPECT_TRUE(status.success);

  CallGraphRecord record;
  record.program_location = "/tmp/program";
  record.class_name = "a.A";
  record.method_name = "main";
  record.tree = &tree;
  record.stats = explorer.stats();

  EXPECT_TRUE(sink->store(record).success);
  EXPECT_TRUE(sink->store(record).success);
  EXPECT_TRUE(sink->flush().success);
  EXPECT_EQ(sink->records_written(), 2u);

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 2u);
  const auto & first = lines[0];
  EXPECT_EQ(first["program"], "/tmp/program");
  EXPECT_EQ(first["class"], "a.A");
  EXPECT_EQ(first["method"], "main");
  EXPECT_EQ(first["stats"]["nodes"], 3);
  EXPECT_EQ(first["stats"]["max_depth"], 1);
  EXPECT_EQ(first["stats"]["truncated"], false);
  EXPECT_EQ(first["stats"]["by_kind"]["expanded"], 2);
  EXPECT_EQ(first["stats"]["by_kind"]["external_unresolved"], 1);
  EXPECT_EQ(first["tree"]["kind"], "expanded");
  EXPECT_EQ(first["tree"]["children"].size(), 2u);
}

TEST(StorageJsonLines, AppendsToExistingFile)
{
  auto program = ProgramBuilder().klass("a.A").method("main", {}).build();
  CallGraphExplorer explorer(*program);
  const CallTreeNode tree = explorer.explore("a.A", "main");

  TempDir dir("sink_append");
  const auto path = dir.path() / "calls.jsonl";

  CallGraphRecord record;
  record.class_name = "a.A";
  record.method_name = "main";
  record.tree = &tree;

  for (int i = 0; i < 2; ++i) {
    SinkStatus status;
    auto sink = JsonLinesSink::open(path, status);
    ASSERT_NE(sink, nullptr);
    EXPECT_TRUE(sink->store(record).success);
  }

  EXPECT_EQ(read_lines(path).size(), 2u);
}

TEST(StorageJsonLines, RecordWithoutTreeIsRejected)
{
  TempDir dir("sink_reject");
  SinkStatus status;
  auto sink = JsonLinesSink::open(dir.path() / "calls.jsonl", status);
  ASSERT_NE(sink, nullptr);

  const SinkStatus s = sink->store(CallGraphRecord{});
  EXPECT_FALSE(s.success);
  EXPECT_FALSE(s.error.empty());
  EXPECT_EQ(sink->records_written(), 0u);
}

TEST(StorageJsonLines, OpenFailsForDirectoryPath)
{
  TempDir dir("sink_fail");
  SinkStatus status;
  auto sink = JsonLinesSink::open(dir.path(), status);
  EXPECT_EQ(sink, nullptr);
  EXPECT_FALSE(status.success);
  EXPECT_FALSE(status.error.empty());
}

TEST(StorageJsonLines, InvalidUtf8NameIsStored)
{
  auto program = ProgramBuilder().klass("a.A").method("main", {}).build();
  CallGraphExplorer explorer(*program);
  const CallTreeNode tree = explorer.explore("com.Bad\xff", "m");

  TempDir dir("sink_utf8");
  const auto path = dir.path() / "calls.jsonl";
  SinkStatus status;
  auto sink = JsonLinesSink::open(path, status);
  ASSERT_NE(sink, nullptr);

  CallGraphRecord record;
  record.class_name = "com.Bad\xff";
  record.method_name = "m";
  record.tree = &tree;
  record.stats = explorer.stats();

  SinkStatus stored;
  ASSERT_NO_THROW(stored = sink->store(record));
  EXPECT_TRUE(stored.success);
  EXPECT_TRUE(sink->flush().success);

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["class"], "com.Bad\xEF\xBF\xBD");
  EXPECT_EQ(lines[0]["tree"]["kind"], "not_found");
}
