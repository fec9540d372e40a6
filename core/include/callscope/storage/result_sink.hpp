// callscope/storage/result_sink.hpp - Persistence of analysis results
//
// A sink accepts one record per analyzed entry point. Sinks are created and
// owned by the caller and handed to the analyzer explicitly; there is no
// process-wide connection.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include "callscope/analysis/call_graph_explorer.hpp"
#include "callscope/analysis/call_tree.hpp"

namespace callscope
{

/**
 * One analyzed entry point, as handed to a sink.
 */
struct CallGraphRecord
{
  std::string program_location;
  std::string class_name;
  std::string method_name;
  const CallTreeNode * tree = nullptr;
  ExploreStats stats;
};

/**
 * Result of a storage operation.
 */
struct SinkStatus
{
  bool success = false;
  std::string error;

  static SinkStatus ok()
  {
    SinkStatus s;
    s.success = true;
    return s;
  }

  static SinkStatus fail(std::string msg)
  {
    SinkStatus s;
    s.error = std::move(msg);
    return s;
  }
};

/**
 * Destination for analysis records.
 */
class ResultSink
{
public:
  virtual ~ResultSink() = default;

  /// Store one record
  virtual SinkStatus store(const CallGraphRecord & record) = 0;

  /// Make stored records durable
  virtual SinkStatus flush() { return SinkStatus::ok(); }
};

/**
 * Appends one JSON object per record to a file (JSON Lines).
 *
 * The file is opened by open() and closed when the sink is destroyed.
 */
class JsonLinesSink final : public ResultSink
{
public:
  JsonLinesSink(const JsonLinesSink &) = delete;
  JsonLinesSink & operator=(const JsonLinesSink &) = delete;

  ~JsonLinesSink() override;

  /**
   * Open (creating parent directories) or append to `path`.
   *
   * @param[out] status failure reason when nullptr is returned
   */
  [[nodiscard]] static std::unique_ptr<JsonLinesSink> open(
    const std::filesystem::path & path, SinkStatus & status);

  SinkStatus store(const CallGraphRecord & record) override;
  SinkStatus flush() override;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] size_t records_written() const noexcept { return written_; }

private:
  JsonLinesSink(std::filesystem::path path, std::ofstream out)
  : path_(std::move(path)), out_(std::move(out))
  {
  }

  std::filesystem::path path_;
  std::ofstream out_;
  size_t written_ = 0;
};

}  // namespace callscope
