#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_config_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_observability_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_provider_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_command_safety_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_command_filter_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_sandbox_tests(std::vector<shellwarden::tests::TestCase> &tests);
void register_runners_binds_tests(std::vector<shellwarden::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<shellwarden::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_provider_tests(tests);
  register_command_safety_tests(tests);
  register_command_filter_tests(tests);
  register_sandbox_tests(tests);
  register_runners_binds_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
