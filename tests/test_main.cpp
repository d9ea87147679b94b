#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<strata::tests::TestCase> &tests);
void register_config_tests(std::vector<strata::tests::TestCase> &tests);
void register_observability_tests(std::vector<strata::tests::TestCase> &tests);
void register_scope_tests(std::vector<strata::tests::TestCase> &tests);
void register_store_tests(std::vector<strata::tests::TestCase> &tests);
void register_vector_tests(std::vector<strata::tests::TestCase> &tests);
void register_capability_tests(std::vector<strata::tests::TestCase> &tests);
void register_policy_tests(std::vector<strata::tests::TestCase> &tests);
void register_pipeline_tests(std::vector<strata::tests::TestCase> &tests);
void register_runner_tests(std::vector<strata::tests::TestCase> &tests);
void register_service_tests(std::vector<strata::tests::TestCase> &tests);
void register_service_integration_tests(std::vector<strata::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<strata::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_scope_tests(tests);
  register_store_tests(tests);
  register_vector_tests(tests);
  register_capability_tests(tests);
  register_policy_tests(tests);
  register_pipeline_tests(tests);
  register_runner_tests(tests);
  register_service_tests(tests);
  register_service_integration_tests(tests);

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
