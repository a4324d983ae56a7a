#include "test_framework.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

void register_common_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_config_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_cdp_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_actor_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_capture_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_compose_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_narration_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_session_tests(std::vector<scenecast::tests::TestCase> &tests);
void register_collab_tests(std::vector<scenecast::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::vector<scenecast::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_cdp_tests(tests);
  register_actor_tests(tests);
  register_capture_tests(tests);
  register_compose_tests(tests);
  register_narration_tests(tests);
  register_session_tests(tests);
  register_collab_tests(tests);

  // Optional substring filter on test names.
  const std::string filter = argc > 1 ? argv[1] : "";

  int passed = 0;
  int failed = 0;
  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    try {
      test.fn();
      ++passed;
      std::cout << "[PASS] " << test.name << "\n";
    } catch (const std::exception &ex) {
      ++failed;
      std::cout << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
