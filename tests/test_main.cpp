#include "test_framework.hpp"

#include "conductor/observability/global.hpp"
#include "conductor/observability/noop_observer.hpp"

#include <csignal>
#include <memory>
#include <iostream>

void register_common_tests(std::vector<conductor::tests::TestCase> &tests);
void register_config_tests(std::vector<conductor::tests::TestCase> &tests);
void register_observability_tests(std::vector<conductor::tests::TestCase> &tests);
void register_provider_tests(std::vector<conductor::tests::TestCase> &tests);
void register_vector_store_tests(std::vector<conductor::tests::TestCase> &tests);
void register_retrieval_tests(std::vector<conductor::tests::TestCase> &tests);
void register_prompt_tests(std::vector<conductor::tests::TestCase> &tests);
void register_router_tests(std::vector<conductor::tests::TestCase> &tests);
void register_context_tests(std::vector<conductor::tests::TestCase> &tests);
void register_session_tests(std::vector<conductor::tests::TestCase> &tests);
void register_cli_tests(std::vector<conductor::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  conductor::observability::set_global_observer(
      std::make_unique<conductor::observability::NoopObserver>());

  std::vector<conductor::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_provider_tests(tests);
  register_vector_store_tests(tests);
  register_retrieval_tests(tests);
  register_prompt_tests(tests);
  register_router_tests(tests);
  register_context_tests(tests);
  register_session_tests(tests);
  register_cli_tests(tests);

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
