#include "combinator/parse_result.hpp"

#include <algorithm>

namespace jsoncomb::combinator {

std::string ParseFailure::Describe() const {
  if (expected.empty()) {
    return "unexpected input";
  }

  std::string text = "expected " + expected.front();
  for (std::size_t i = 1; i < expected.size(); ++i) {
    text += (i + 1 == expected.size()) ? " or " : ", ";
    text += expected[i];
  }
  return text;
}

void MergeExpected(std::vector<std::string>& into, const std::vector<std::string>& from) {
  for (const auto& item : from) {
    if (std::find(into.begin(), into.end(), item) == into.end()) {
      into.push_back(item);
    }
  }
}

} // namespace jsoncomb::combinator
