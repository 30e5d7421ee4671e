#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shellwarden::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the searched text appended, which is usually what you need to see.
inline void require_contains(const std::string &haystack, const std::string &needle,
                             const std::string &message) {
  if (haystack.find(needle) == std::string::npos) {
    throw std::runtime_error(message + " (missing \"" + needle + "\" in: " + haystack + ")");
  }
}

} // namespace shellwarden::tests
