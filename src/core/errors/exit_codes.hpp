#pragma once

namespace jsoncomb::core::errors {

// Process-exit contract for the jsoncomb CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let scripts tell a malformed document apart from a
// document that parsed but did not match its expected rendering.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kParseFailed = 10,
  kSampleMismatch = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace jsoncomb::core::errors
