#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>

namespace {

// Removes the shared temp root left behind by tests that failed before cleanup.
class TempRootEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path(ec) / "mdquery_tests", ec);
    if (ec) {
      std::cerr << "[mdquery_tests] Could not remove temp root: " << ec.message() << std::endl;
    }
  }
};

}  // namespace

int main(int argc, char **argv) {
  std::cout << "Running mdquery Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new TempRootEnvironment);

  int result = RUN_ALL_TESTS();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
