#pragma once

#include "core/logging/logger.hpp"
#include "json/grammar.hpp"

#include <cstddef>
#include <filesystem>

namespace jsoncomb::cli {

// Options for `jsoncomb parse`.
struct ParseCommandOptions {
  std::filesystem::path input_path;
  // Empty means stdout.
  std::filesystem::path output_path;
  bool pretty = false;
  int indent = 2;
  std::size_t max_depth = json::kDefaultMaxDepth;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options for `jsoncomb check`, the sample acceptance contract: the input
// document must parse to the same value as the expected rendering.
struct CheckCommandOptions {
  std::filesystem::path input_path;
  std::filesystem::path expected_path;
  std::size_t max_depth = json::kDefaultMaxDepth;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses one file and writes its rendering. Returns a process exit code.
int ExecuteParse(const ParseCommandOptions& options);

// Compares one sample against its expected rendering. Returns a process exit
// code.
int ExecuteCheck(const CheckCommandOptions& options);

// Routes `jsoncomb` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => I/O failure
//   2  => usage error (unknown command / invalid args)
//   10 => input is not valid JSON
//   30 => sample does not match its expected rendering
int Dispatch(int argc, char** argv);

} // namespace jsoncomb::cli
