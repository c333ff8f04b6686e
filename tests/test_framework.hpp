#pragma once

#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkguard::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

using TestList = std::vector<TestCase>;

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Like require, but puts both values into the failure message.
template <typename Actual, typename Expected>
void require_equal(const Actual &actual, const Expected &expected, const std::string &message) {
  if (!(actual == expected)) {
    std::ostringstream out;
    out << message << ": expected " << expected << ", got " << actual;
    throw std::runtime_error(out.str());
  }
}

} // namespace chunkguard::tests
