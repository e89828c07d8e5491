#include "jsoncomb/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/text_location.hpp"
#include "json/parse.hpp"
#include "json/render.hpp"
#include "json/value.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace jsoncomb::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitParseFailed = core::errors::ToInt(core::errors::ExitCode::kParseFailed);
constexpr int kExitSampleMismatch = core::errors::ToInt(core::errors::ExitCode::kSampleMismatch);

constexpr int kMaxIndent = 16;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  jsoncomb parse <input.json> [--out <file>] [--pretty [--indent <0-16>]] "
         "[--max-depth <n>] [--log-level <debug|info|warn|error>]\n"
      << "  jsoncomb check <input.json> <expected.json> [--max-depth <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  jsoncomb version\n"
      << "  jsoncomb help\n";
}

bool ParseUnsigned(std::string_view raw, std::size_t& value) {
  if (raw.empty()) {
    return false;
  }
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  return ec == std::errc() && end == raw.data() + raw.size();
}

// Options shared by every document-reading command. Returns true when `args[i]`
// was one of them (advancing `i` past its value).
bool ConsumeCommonOption(const std::vector<std::string_view>& args, std::size_t& i,
                         std::size_t& max_depth, core::logging::LogLevel& log_level,
                         bool& consumed, std::string& error) {
  consumed = false;
  const std::string_view token = args[i];
  if (token == "--max-depth") {
    consumed = true;
    if (i + 1 >= args.size()) {
      error = "missing value for --max-depth";
      return false;
    }
    if (!ParseUnsigned(args[i + 1], max_depth)) {
      error = "invalid --max-depth '" + std::string(args[i + 1]) +
              "' (expected a non-negative integer; 0 disables the limit)";
      return false;
    }
    ++i;
    return true;
  }
  if (token == "--log-level") {
    consumed = true;
    if (i + 1 >= args.size()) {
      error = "missing value for --log-level";
      return false;
    }
    if (!core::logging::ParseLogLevel(args[i + 1], log_level, error)) {
      return false;
    }
    ++i;
    return true;
  }
  return true;
}

// Parse `parse` args with an explicit contract:
// - exactly one input path
// - `--indent` only together with `--pretty`
// Unknown flags and extra positionals are usage errors.
bool ParseParseOptions(const std::vector<std::string_view>& args, ParseCommandOptions& options,
                       std::string& error) {
  bool indent_given = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ConsumeCommonOption(args, i, options.max_depth, options.log_level, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (token == "--pretty") {
      options.pretty = true;
      continue;
    }
    if (token == "--indent") {
      if (i + 1 >= args.size()) {
        error = "missing value for --indent";
        return false;
      }
      std::size_t indent = 0;
      if (!ParseUnsigned(args[i + 1], indent) || indent > static_cast<std::size_t>(kMaxIndent)) {
        error = "invalid --indent '" + std::string(args[i + 1]) + "' (expected 0-16)";
        return false;
      }
      options.indent = static_cast<int>(indent);
      indent_given = true;
      ++i;
      continue;
    }
    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "parse accepts exactly 1 input path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "parse requires exactly 1 argument: <input.json>";
    return false;
  }
  if (indent_given && !options.pretty) {
    error = "--indent requires --pretty";
    return false;
  }
  return true;
}

bool ParseCheckOptions(const std::vector<std::string_view>& args, CheckCommandOptions& options,
                       std::string& error) {
  std::vector<fs::path> positionals;
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ConsumeCommonOption(args, i, options.max_depth, options.log_level, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.emplace_back(token);
  }

  if (positionals.size() != 2) {
    error = "check requires exactly 2 arguments: <input.json> <expected.json>";
    return false;
  }
  options.input_path = positionals[0];
  options.expected_path = positionals[1];
  return true;
}

enum class LoadStatus {
  kLoaded,
  kIoFailed,
  kParseFailed,
};

// Reads and parses one document, reporting failures on stderr and in the log.
// Parse errors are shown as <path>:<line>:<col> so editors can jump to them.
LoadStatus LoadDocument(const fs::path& path, std::size_t max_depth, core::logging::Logger& logger,
                        json::Value& document) {
  std::string error;
  std::string text;
  if (!core::CheckInputFile(path, error) || !core::ReadTextFile(path, text, error)) {
    logger.Error("failed to read input", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return LoadStatus::kIoFailed;
  }
  logger.Debug("input loaded", {{"path", path.string()}, {"bytes", std::to_string(text.size())}});

  json::ParseError parse_error;
  if (!json::Parse(text, document, parse_error, json::ParseOptions{.max_depth = max_depth})) {
    const core::TextLocation location = core::LocateOffset(text, parse_error.offset);
    logger.Error("parse failed", {{"path", path.string()},
                                  {"kind", json::ToString(parse_error.kind)},
                                  {"offset", std::to_string(parse_error.offset)},
                                  {"location", core::FormatLocation(location)},
                                  {"expected", parse_error.expected}});
    std::cerr << "error: " << path.string() << ':' << core::FormatLocation(location) << ": "
              << json::ToString(parse_error.kind) << ": " << parse_error.expected << '\n';
    return LoadStatus::kParseFailed;
  }

  logger.Debug("document parsed", {{"path", path.string()},
                                   {"type", json::ToString(document.Kind())},
                                   {"size", std::to_string(document.Size())}});
  return LoadStatus::kLoaded;
}

int ExitCodeFor(LoadStatus status) {
  return status == LoadStatus::kParseFailed ? kExitParseFailed : kExitFailure;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::cout << "jsoncomb 0.1.0\n";
  return kExitSuccess;
}

int CommandParse(const std::vector<std::string_view>& args) {
  ParseCommandOptions options;
  std::string error;
  if (!ParseParseOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteParse(options);
}

int CommandCheck(const std::vector<std::string_view>& args) {
  CheckCommandOptions options;
  std::string error;
  if (!ParseCheckOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteCheck(options);
}

} // namespace

int ExecuteParse(const ParseCommandOptions& options) {
  core::logging::Logger logger("parse", options.log_level);
  logger.SetInput(options.input_path.string());
  logger.Info("parse requested",
              {{"max_depth", std::to_string(options.max_depth)},
               {"output", options.output_path.empty() ? "-" : options.output_path.string()}});

  json::Value document;
  const LoadStatus status = LoadDocument(options.input_path, options.max_depth, logger, document);
  if (status != LoadStatus::kLoaded) {
    return ExitCodeFor(status);
  }

  const std::string rendering =
      options.pretty ? json::ToPrettyJson(document, options.indent) : json::ToJson(document);

  if (options.output_path.empty()) {
    std::cout << rendering << '\n';
  } else {
    std::string error;
    if (!core::WriteTextFileAtomic(options.output_path, rendering + "\n", error)) {
      logger.Error("failed to write output", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Debug("output written", {{"path", options.output_path.string()}});
  }

  logger.Info("parse completed", {{"type", json::ToString(document.Kind())},
                                  {"size", std::to_string(document.Size())}});
  return kExitSuccess;
}

int ExecuteCheck(const CheckCommandOptions& options) {
  core::logging::Logger logger("check", options.log_level);
  logger.SetInput(options.input_path.string());
  logger.Info("check requested", {{"expected", options.expected_path.string()}});

  json::Value actual;
  const LoadStatus actual_status =
      LoadDocument(options.input_path, options.max_depth, logger, actual);
  if (actual_status != LoadStatus::kLoaded) {
    return ExitCodeFor(actual_status);
  }

  // A broken expectation file is a fixture problem, not a sample failure.
  json::Value expected;
  logger.SetInput(options.expected_path.string());
  if (LoadDocument(options.expected_path, options.max_depth, logger, expected) !=
      LoadStatus::kLoaded) {
    return kExitFailure;
  }
  logger.SetInput(options.input_path.string());

  if (actual != expected) {
    logger.Warn("sample mismatch", {{"expected", options.expected_path.string()}});
    std::cerr << "mismatch: " << options.input_path.string() << '\n'
              << "  expected: " << json::ToJson(expected) << '\n'
              << "  actual:   " << json::ToJson(actual) << '\n';
    return kExitSampleMismatch;
  }

  logger.Info("sample matched", {{"expected", options.expected_path.string()}});
  std::cout << "match: " << options.input_path.string() << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "parse") {
    return CommandParse(args);
  }

  if (command == "check") {
    return CommandCheck(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace jsoncomb::cli
