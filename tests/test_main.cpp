#include "test_framework.hpp"

#include <csignal>
#include <cstring>
#include <iostream>

void register_common_tests(std::vector<engram::tests::TestCase> &tests);
void register_config_tests(std::vector<engram::tests::TestCase> &tests);
void register_observability_tests(std::vector<engram::tests::TestCase> &tests);
void register_dag_tests(std::vector<engram::tests::TestCase> &tests);
void register_store_tests(std::vector<engram::tests::TestCase> &tests);
void register_policy_tests(std::vector<engram::tests::TestCase> &tests);
void register_recall_tests(std::vector<engram::tests::TestCase> &tests);
void register_audit_tests(std::vector<engram::tests::TestCase> &tests);
void register_runtime_tests(std::vector<engram::tests::TestCase> &tests);
void register_command_tests(std::vector<engram::tests::TestCase> &tests);
void register_scenario_integration_tests(std::vector<engram::tests::TestCase> &tests);
void register_concurrency_integration_tests(std::vector<engram::tests::TestCase> &tests);

int main(int argc, char **argv) {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<engram::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_dag_tests(tests);
  register_store_tests(tests);
  register_policy_tests(tests);
  register_recall_tests(tests);
  register_audit_tests(tests);
  register_runtime_tests(tests);
  register_command_tests(tests);
  register_scenario_integration_tests(tests);
  register_concurrency_integration_tests(tests);

  // Optional substring filter: engram_tests <pattern>
  const char *filter = argc > 1 ? argv[1] : nullptr;

  std::size_t ran = 0;
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (filter != nullptr && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " tests: " << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
