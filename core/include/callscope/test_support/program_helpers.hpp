// callscope/test_support/program_helpers.hpp - helpers for unit/integration tests
//
// Builds small in-memory programs without going through manifest files.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "callscope/model/program_model.hpp"

namespace callscope::test_support
{

/// Call-site text for `cls.method(params)` returning void
[[nodiscard]] inline std::string call(
  std::string_view cls, std::string_view method, const std::vector<std::string> & params = {})
{
  std::string text = "<" + std::string(cls) + ": void " + std::string(method) + "(";
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) text += ",";
    text += params[i];
  }
  text += ")>";
  return text;
}

/**
 * Fluent builder:
 *
 * @code
 *   auto program = ProgramBuilder()
 *     .klass("A").method("main", {call("A", "helper")})
 *                .method("helper", {})
 *     .build();
 * @endcode
 */
class ProgramBuilder
{
public:
  ProgramBuilder & klass(std::string name)
  {
    flush();
    current_ = std::make_unique<ClassDescriptor>(std::move(name));
    return *this;
  }

  ProgramBuilder & method(
    std::string name, std::vector<std::string> calls, std::vector<std::string> params = {})
  {
    if (!current_) {
      throw std::logic_error("ProgramBuilder::method() called before klass()");
    }
    std::vector<InvocationSite> sites;
    sites.reserve(calls.size());
    for (auto & c : calls) {
      sites.push_back(InvocationSite{std::move(c)});
    }
    current_->add_method(std::move(name), std::move(params), "void", std::move(sites));
    return *this;
  }

  [[nodiscard]] std::unique_ptr<Program> build()
  {
    flush();
    auto out = std::make_unique<Program>();
    for (auto & c : classes_) {
      if (!out->add_class(std::move(c))) {
        throw std::logic_error("ProgramBuilder: duplicate class");
      }
    }
    classes_.clear();
    return out;
  }

private:
  void flush()
  {
    if (current_) {
      classes_.push_back(std::move(current_));
    }
  }

  std::unique_ptr<ClassDescriptor> current_;
  std::vector<std::unique_ptr<ClassDescriptor>> classes_;
};

/**
 * Temporary directory removed on destruction.
 */
class TempDir
{
public:
  explicit TempDir(std::string_view tag)
  {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
      auto candidate = base / ("callscope_" + std::string(tag) + "_" + std::to_string(i));
      std::error_code ec;
      if (fs::create_directories(candidate, ec) && !ec) {
        path_ = candidate;
        return;
      }
    }
    throw std::runtime_error("failed to create temporary directory");
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `content` to a file relative to the directory
  std::filesystem::path write(const std::filesystem::path & rel, const std::string & content) const
  {
    const auto p = path_ / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) {
      throw std::runtime_error("failed to write file: " + p.string());
    }
    out << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

}  // namespace callscope::test_support
