#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_sanitizer_tests(std::vector<calx::tests::TestCase> &tests);
void register_chunker_tests(std::vector<calx::tests::TestCase> &tests);
void register_continuation_tests(std::vector<calx::tests::TestCase> &tests);
void register_query_tests(std::vector<calx::tests::TestCase> &tests);
void register_provider_tests(std::vector<calx::tests::TestCase> &tests);
void register_security_tests(std::vector<calx::tests::TestCase> &tests);
void register_policy_tests(std::vector<calx::tests::TestCase> &tests);
void register_config_tests(std::vector<calx::tests::TestCase> &tests);
void register_observability_tests(std::vector<calx::tests::TestCase> &tests);
void register_gateway_tests(std::vector<calx::tests::TestCase> &tests);
void register_runtime_tests(std::vector<calx::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<calx::tests::TestCase> tests;
  register_sanitizer_tests(tests);
  register_chunker_tests(tests);
  register_continuation_tests(tests);
  register_query_tests(tests);
  register_provider_tests(tests);
  register_security_tests(tests);
  register_policy_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_gateway_tests(tests);
  register_runtime_tests(tests);

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
