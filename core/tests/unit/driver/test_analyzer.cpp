// tests/unit/driver/test_analyzer.cpp - Load and explore pipeline

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "callscope/driver/analyzer.hpp"
#include "callscope/render/tree_renderer.hpp"
#include "callscope/test_support/program_helpers.hpp"

using namespace callscope;
using test_support::TempDir;

namespace
{

const char * k_shop_manifest = R"({
  "classes": [
    {
      "name": "com.shop.Checkout",
      "methods": [
        {
          "name": "pay",
          "invocations": [
            "<com.shop.Ledger: void record(long)>",
            "<com.shop.Checkout: void pay()>"
          ]
        }
      ]
    },
    {
      "name": "com.shop.Ledger",
      "methods": [
        { "name": "record", "parameters": ["long"], "invocations": ["<java.util.List: boolean add(java.lang.Object)>"] }
      ]
    }
  ]
})";

/// Sink that records calls and optionally fails
class RecordingSink final : public ResultSink
{
public:
  explicit RecordingSink(bool fail_store = false) : fail_store_(fail_store) {}

  SinkStatus store(const CallGraphRecord & record) override
  {
    if (fail_store_) {
      return SinkStatus::fail("disk full");
    }
    stored.push_back(record.class_name + "." + record.method_name);
    return SinkStatus::ok();
  }

  SinkStatus flush() override
  {
    ++flushes;
    return SinkStatus::ok();
  }

  std::vector<std::string> stored;
  int flushes = 0;

private:
  bool fail_store_;
};

}  // namespace

// ============================================================================
// Test: Single entry point
// ============================================================================
TEST(DriverAnalyzer, AnalyzeCallStack)
{
  TempDir dir("driver_stack");
  const auto manifest = dir.write("shop.json", k_shop_manifest);

  const auto result = Analyzer::analyze_call_stack(manifest, "com.shop.Checkout", "pay");
  ASSERT_TRUE(result.success);
  ASSERT_NE(result.program, nullptr);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(result.entries.size(), 1u);

  const std::string expected =
    "com.shop.Checkout.pay\n"
    "  com.shop.Ledger.record\n"
    "    <java.util.List: boolean add(java.lang.Object)> (external or unresolved)\n"
    "  com.shop.Checkout.pay (recursive call, stopping here)\n";
  EXPECT_EQ(render_text(result.entries[0].tree), expected);
  EXPECT_EQ(result.entries[0].stats.node_count, 4u);
}

TEST(DriverAnalyzer, MissingEntryIsAWarningNotAFailure)
{
  TempDir dir("driver_missing");
  dir.write("shop.json", k_shop_manifest);

  const auto result = Analyzer::analyze_call_stack(dir.path(), "com.shop.Refund", "issue");
  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.entries.size(), 1u);
  EXPECT_FALSE(result.entries[0].found());
  EXPECT_EQ(render_text(result.entries[0].tree), "Class not found: com.shop.Refund\n");
  EXPECT_FALSE(result.diagnostics.has_errors());
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_entry_not_found));
}

TEST(DriverAnalyzer, LoadFailureIsFatal)
{
  TempDir dir("driver_badload");
  const auto manifest = dir.write("broken.json", "{");

  const auto result = Analyzer::analyze_call_stack(manifest, "a.A", "main");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.program, nullptr);
  EXPECT_TRUE(result.entries.empty());
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_manifest_parse));
}

TEST(DriverAnalyzer, TruncationIsReportedAsInfo)
{
  TempDir dir("driver_budget");
  const auto manifest = dir.write("shop.json", k_shop_manifest);

  AnalysisOptions options;
  options.explore.max_nodes = 1;
  const auto result = Analyzer::analyze_call_stack(manifest, "com.shop.Checkout", "pay", options);

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.entries[0].stats.truncated);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all()[0].severity, Severity::Info);
}

// ============================================================================
// Test: Several entry points
// ============================================================================
TEST(DriverAnalyzer, EntriesKeepRequestOrderAndReachSink)
{
  TempDir dir("driver_entries");
  const auto manifest = dir.write("shop.json", k_shop_manifest);

  const std::vector<EntryPointConfig> entries{
    {"com.shop.Ledger", "record"}, {"com.shop.Checkout", "pay"}, {"com.shop.Nope", "x"}};

  RecordingSink sink;
  AnalysisOptions options;
  options.sink = &sink;

  const auto result = Analyzer::analyze_entries(manifest, entries, options);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.entries.size(), 3u);
  EXPECT_EQ(result.entries[0].entry.class_name, "com.shop.Ledger");
  EXPECT_EQ(result.entries[1].entry.class_name, "com.shop.Checkout");
  EXPECT_FALSE(result.entries[2].found());

  const std::vector<std::string> expected{
    "com.shop.Ledger.record", "com.shop.Checkout.pay", "com.shop.Nope.x"};
  EXPECT_EQ(sink.stored, expected);
  EXPECT_EQ(sink.flushes, 1);
}

TEST(DriverAnalyzer, SinkFailureFailsTheRun)
{
  TempDir dir("driver_sinkfail");
  const auto manifest = dir.write("shop.json", k_shop_manifest);

  RecordingSink sink(true);
  AnalysisOptions options;
  options.sink = &sink;

  const auto result = Analyzer::analyze_call_stack(manifest, "com.shop.Checkout", "pay", options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.entries.size(), 1u);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_storage));
}

// ============================================================================
// Test: Project configuration
// ============================================================================
TEST(DriverAnalyzer, AnalyzeProjectUsesConfiguredSettings)
{
  TempDir dir("driver_project");
  dir.write("program/shop.json", k_shop_manifest);
  const auto config_path = dir.write(
    k_project_config_file_name,
    "program:\n"
    "  location: program\n"
    "analysis:\n"
    "  max_depth: 1\n"
    "entry_points:\n"
    "  - class: com.shop.Checkout\n"
    "    method: pay\n");

  const auto loaded = load_project_config(config_path);
  ASSERT_TRUE(loaded.success) << loaded.error;

  const auto result = Analyzer::analyze_project(loaded.config);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.entries.size(), 1u);

  const auto & record = result.entries[0].tree.children.at(0);
  EXPECT_EQ(record.kind, CallNodeKind::Expanded);
  ASSERT_EQ(record.children.size(), 1u);
  EXPECT_EQ(record.children[0].kind, CallNodeKind::ExternalUnresolved);
  EXPECT_FALSE(result.entries[0].stats.truncated);
}

TEST(DriverAnalyzer, AnalyzeProjectWithoutEntryPoints)
{
  ProjectConfig config;
  config.program_location = "/nonexistent";

  const auto result = Analyzer::analyze_project(config);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_configuration));
}
