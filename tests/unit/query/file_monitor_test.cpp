#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "mdquery/query/file_monitor.hpp"
#include "utilities_test.hpp"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace mdquery_tests {

using namespace mdquery;

class FileMonitorTest : public IndexBackendTestBase {
 protected:
  void SetUp() override {
    IndexBackendTestBase::SetUp();
    add_file("/Users/tester/Documents/draft.txt");
    add_file("/Users/tester/Documents/other.txt");
  }

  std::unique_ptr<FileMonitor> make_monitor(const std::string& path) {
    auto monitor = std::make_unique<FileMonitor>(
        *backend_, path,
        [this](const std::optional<std::string>& new_path) { reported_.push_back(new_path); },
        TestUtilities::immediate_options());
    monitor->set_notification_interval(std::chrono::milliseconds(0));
    return monitor;
  }

  std::vector<std::optional<std::string>> reported_;
};

TEST_F(FileMonitorTest, StartingDoesNotReportTheCurrentPath) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");

  // Act
  monitor->start();

  // Assert
  EXPECT_TRUE(monitor->is_monitoring());
  EXPECT_THAT(reported_, IsEmpty());
  ASSERT_EQ(monitor->history().size(), 1u);
  EXPECT_EQ(monitor->history()[0].path, "/Users/tester/Documents/draft.txt");
}

TEST_F(FileMonitorTest, ReportsTheNewPathAfterAMove) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  // Act
  ASSERT_TRUE(backend_->move("/Users/tester/Documents/draft.txt",
                             "/Users/tester/Archive/final.txt"));

  // Assert
  ASSERT_EQ(reported_.size(), 1u);
  EXPECT_EQ(reported_[0], "/Users/tester/Archive/final.txt");
  EXPECT_EQ(monitor->path(), "/Users/tester/Archive/final.txt");
}

TEST_F(FileMonitorTest, ReportsDeletion) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  // Act
  ASSERT_TRUE(backend_->remove("/Users/tester/Documents/draft.txt"));

  // Assert
  ASSERT_EQ(reported_.size(), 1u);
  EXPECT_FALSE(reported_[0].has_value());
  EXPECT_FALSE(monitor->path().has_value());
}

TEST_F(FileMonitorTest, ContentChangesAreNotReported) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  // Act
  add_file("/Users/tester/Documents/draft.txt", 99999);

  // Assert
  EXPECT_THAT(reported_, IsEmpty());
}

TEST_F(FileMonitorTest, OtherFilesAreIgnored) {
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  backend_->move("/Users/tester/Documents/other.txt", "/Users/tester/Documents/renamed.txt");

  EXPECT_THAT(reported_, IsEmpty());
}

TEST_F(FileMonitorTest, HistoryIsNewestFirst) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  // Act
  backend_->move("/Users/tester/Documents/draft.txt", "/Users/tester/Documents/v2.txt");
  backend_->move("/Users/tester/Documents/v2.txt", "/Users/tester/Documents/v3.txt");

  // Assert
  auto history = monitor->history();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].path, "/Users/tester/Documents/v3.txt");
  EXPECT_EQ(history[1].path, "/Users/tester/Documents/v2.txt");
  EXPECT_EQ(history[2].path, "/Users/tester/Documents/draft.txt");
  EXPECT_THAT(reported_, ElementsAre("/Users/tester/Documents/v2.txt",
                                     "/Users/tester/Documents/v3.txt"));
}

TEST_F(FileMonitorTest, SetPathFollowsAnotherFile) {
  // Arrange
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  // Act
  monitor->set_path(std::string("/Users/tester/Documents/other.txt"));
  backend_->move("/Users/tester/Documents/draft.txt", "/Users/tester/Documents/ignored.txt");
  backend_->move("/Users/tester/Documents/other.txt", "/Users/tester/Documents/followed.txt");

  // Assert
  EXPECT_THAT(reported_, ElementsAre("/Users/tester/Documents/followed.txt"));
  ASSERT_EQ(monitor->history().size(), 2u);
  EXPECT_EQ(monitor->history()[1].path, "/Users/tester/Documents/other.txt");
}

TEST_F(FileMonitorTest, ClearingThePathStopsMonitoring) {
  auto monitor = make_monitor("/Users/tester/Documents/draft.txt");
  monitor->start();

  monitor->set_path(std::nullopt);

  EXPECT_FALSE(monitor->is_monitoring());
  EXPECT_EQ(backend_->active_requests(), 0u);
}

TEST_F(FileMonitorTest, UnindexedFileIsReportedAsGone) {
  auto monitor = make_monitor("/Users/tester/Documents/missing.txt");

  monitor->start();

  ASSERT_EQ(reported_.size(), 1u);
  EXPECT_FALSE(reported_[0].has_value());
}

}  // namespace mdquery_tests
