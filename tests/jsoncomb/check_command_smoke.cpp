#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using jsoncomb::tests::common::AssertContains;
using jsoncomb::tests::common::AssertExitCode;
using jsoncomb::tests::common::CreateUniqueTempDir;
using jsoncomb::tests::common::DispatchWithCapturedOutput;
using jsoncomb::tests::common::RemovePathBestEffort;
using jsoncomb::tests::common::WriteTextFile;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("jsoncomb-check-smoke");
  const fs::path input_path = temp_root / "input.json";
  const fs::path expected_path = temp_root / "expected.json";
  const fs::path different_path = temp_root / "different.json";
  const fs::path broken_path = temp_root / "broken.json";

  WriteTextFile(input_path, "{ \"b\": [1, 2.50], \"a\": \"x\", \"b\": [1, 25e-1] }\n");
  WriteTextFile(expected_path, "{\"b\":[1,2.5],\"a\":\"x\"}\n");
  WriteTextFile(different_path, "{\"a\":\"x\",\"b\":[1,2.5]}\n");
  WriteTextFile(broken_path, "{\"a\":\n");

  std::string out;
  std::string err;

  // Semantic equality: whitespace, number spelling and duplicate keys do not
  // matter once parsed.
  int exit_code = DispatchWithCapturedOutput(
      {"jsoncomb", "check", input_path.string(), expected_path.string()}, out, err);
  AssertExitCode(exit_code, 0, "check matching sample");
  AssertContains(out, "match: " + input_path.string());
  AssertContains(err, "msg=\"sample matched\"");

  // Member order is part of the value.
  exit_code = DispatchWithCapturedOutput(
      {"jsoncomb", "check", input_path.string(), different_path.string()}, out, err);
  AssertExitCode(exit_code, 30, "check reordered sample");
  AssertContains(err, "mismatch: " + input_path.string());
  AssertContains(err, "expected: {\"a\":\"x\",\"b\":[1,2.5]}");
  AssertContains(err, "actual:   {\"b\":[1,2.5],\"a\":\"x\"}");
  AssertContains(err, "level=WARN");

  // A malformed input is a parse failure.
  exit_code = DispatchWithCapturedOutput(
      {"jsoncomb", "check", broken_path.string(), expected_path.string()}, out, err);
  AssertExitCode(exit_code, 10, "check malformed input");
  AssertContains(err, broken_path.string() + ":2:1: syntax error: expected JSON value");

  // A malformed expectation is a fixture problem.
  exit_code = DispatchWithCapturedOutput(
      {"jsoncomb", "check", input_path.string(), broken_path.string()}, out, err);
  AssertExitCode(exit_code, 1, "check malformed expectation");
  AssertContains(err, broken_path.string() + ":2:1: syntax error");
  AssertContains(err, "level=ERROR cmd=check input=\"" + broken_path.string() +
                          "\" msg=\"parse failed\"");

  exit_code = DispatchWithCapturedOutput(
      {"jsoncomb", "check", input_path.string(), (temp_root / "missing.json").string()}, out,
      err);
  AssertExitCode(exit_code, 1, "check missing expectation");

  RemovePathBestEffort(temp_root);
  std::cout << "check_command_smoke: ok\n";
  return 0;
}
