#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mdquery/index/sqlite_index_backend.hpp"
#include "mdquery/query/metadata_item.hpp"
#include "mdquery/query/query_options.hpp"
#include "mdquery/query/result_reconciler.hpp"

namespace mdquery_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Time utilities
  static mdquery::TimePoint time_at(const std::string& iso8601);

  // Test data creation
  static mdquery::MetadataItemPtr create_test_item(mdquery::ItemId id, const std::string& path,
                                                   mdquery::AttributeValues values = {});
  static mdquery::MetadataItemPtr create_test_folder(mdquery::ItemId id, const std::string& path);
  static mdquery::AttributeValues create_file_values(const std::string& name,
                                                     std::int64_t size = 1024,
                                                     const std::string& modified =
                                                         "2024-03-15T10:00:00Z");
  static std::vector<mdquery::ItemId> ids_of(const std::vector<mdquery::MetadataItemPtr>& items);

  // Options that publish on every batch, without path prefetch
  static mdquery::QueryOptions immediate_options();

  // Filesystem utilities
  static std::filesystem::path create_temp_dir(const std::string& prefix);
  static void cleanup_temp_dir(const std::filesystem::path& dir);
  static void write_file(const std::filesystem::path& path, const std::string& contents);
};

/**
 * Collects results handler deliveries for later inspection
 */
class ResultsRecorder {
 public:
  struct Delivery {
    std::vector<mdquery::MetadataItemPtr> items;
    mdquery::ResultsDifference diff;
  };

  mdquery::ResultsHandler handler();

  size_t count() const;
  Delivery last() const;
  Delivery at(size_t index) const;

  // Waits until at least `count` deliveries arrived.
  bool wait_for(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<Delivery> deliveries_;
};

/**
 * Base test fixture that provides an in-memory SqliteIndexBackend
 */
class IndexBackendTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_unique<mdquery::SqliteIndexBackend>(":memory:");
    backend_->set_home_directory("/Users/tester");
  }

  void TearDown() override {
    backend_.reset();
  }

  // Stores a file with name, size and modification date.
  mdquery::ItemId add_file(const std::string& path, std::int64_t size = 1024,
                           const std::string& modified = "2024-03-15T10:00:00Z") {
    auto slash = path.find_last_of('/');
    return backend_->upsert(path, TestUtilities::create_file_values(path.substr(slash + 1), size,
                                                                    modified));
  }

  std::unique_ptr<mdquery::SqliteIndexBackend> backend_;
};

}  // namespace mdquery_tests
