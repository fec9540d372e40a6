// callscope/storage/result_sink.cpp - JSON Lines result sink
//
#include "callscope/storage/result_sink.hpp"

#include <fmt/core.h>

#include <nlohmann/json.hpp>
#include <system_error>

#include "callscope/render/tree_renderer.hpp"

namespace callscope
{

namespace
{

nlohmann::json j_stats(const ExploreStats & stats)
{
  nlohmann::json by_kind = nlohmann::json::object();
  for (size_t i = 0; i < stats.by_kind.size(); ++i) {
    by_kind[std::string(to_string(static_cast<CallNodeKind>(i)))] = stats.by_kind[i];
  }
  return nlohmann::json{
    {"nodes", stats.node_count},
    {"max_depth", stats.max_depth_reached},
    {"truncated", stats.truncated},
    {"by_kind", std::move(by_kind)}};
}

}  // namespace

JsonLinesSink::~JsonLinesSink()
{
  if (out_.is_open()) {
    out_.close();
  }
}

std::unique_ptr<JsonLinesSink> JsonLinesSink::open(
  const std::filesystem::path & path, SinkStatus & status)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      status = SinkStatus::fail(
        fmt::format("cannot create directory '{}': {}", path.parent_path().string(), ec.message()));
      return nullptr;
    }
  }

  std::ofstream out(path, std::ios::out | std::ios::app);
  if (!out.is_open()) {
    status = SinkStatus::fail(fmt::format("cannot open '{}' for writing", path.string()));
    return nullptr;
  }

  status = SinkStatus::ok();
  return std::unique_ptr<JsonLinesSink>(new JsonLinesSink(path, std::move(out)));
}

SinkStatus JsonLinesSink::store(const CallGraphRecord & record)
{
  if (record.tree == nullptr) {
    return SinkStatus::fail("record has no call tree");
  }

  const nlohmann::json line{
    {"program", record.program_location},
    {"class", record.class_name},
    {"method", record.method_name},
    {"stats", j_stats(record.stats)},
    {"tree", to_json(*record.tree)}};

  // Invalid UTF-8 in names from the command line or config is replaced, not fatal
  out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
  if (!out_) {
    return SinkStatus::fail(fmt::format("write to '{}' failed", path_.string()));
  }
  ++written_;
  return SinkStatus::ok();
}

SinkStatus JsonLinesSink::flush()
{
  out_.flush();
  if (!out_) {
    return SinkStatus::fail(fmt::format("flush of '{}' failed", path_.string()));
  }
  return SinkStatus::ok();
}

}  // namespace callscope
