#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include "mdquery/query/metadata_query.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace mdquery_tests {

using namespace mdquery;

class MetadataQueryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_.put_item(1, "/Users/tester/Documents/report.txt",
                      TestUtilities::create_file_values("report.txt", 1000));
    backend_.put_item(2, "/Users/tester/Documents/notes.txt",
                      TestUtilities::create_file_values("notes.txt", 2000));
    backend_.put_item(3, "/Users/tester/Documents/Archive/old-report.txt",
                      TestUtilities::create_file_values("old-report.txt", 3000));
    backend_.put_item(4, "/Users/tester/Documents/todo.txt",
                      TestUtilities::create_file_values("todo.txt", 4000));
  }

  std::unique_ptr<MetadataQuery> make_query(bool monitor = false) {
    QueryOptions options = TestUtilities::immediate_options();
    options.monitor_results = monitor;
    auto query = std::make_unique<MetadataQuery>(backend_, options);
    query->set_results_handler(recorder_.handler());
    return query;
  }

  NiceMock<MockBackend> backend_;
  ResultsRecorder recorder_;
};

TEST_F(MetadataQueryTest, StartSubmitsTheCompiledRequest) {
  // Arrange
  auto query = make_query();
  query->set_predicate([](const PredicateRoot& item) {
    return item.file_name().contains("report");
  });
  query->set_attributes({AttributeId::FileSize});
  query->set_search_locations({"/Users/tester/Documents"});
  query->set_search_scopes({SearchScope::Home});
  query->set_sort({SortDescriptor::descending(AttributeId::FileSize)});
  EXPECT_CALL(backend_, start(1)).Times(1);

  // Act
  query->start();

  // Assert
  QueryRequest request = backend_.last_request();
  EXPECT_EQ(request.query, "kMDItemFSName == \"*report*\"cd");
  EXPECT_FALSE(request.predicate.empty());
  EXPECT_THAT(request.search_locations, ElementsAre("/Users/tester/Documents"));
  EXPECT_THAT(request.search_scopes, ElementsAre(SearchScope::Home));
  ASSERT_EQ(request.sort.size(), 1u);
  EXPECT_FALSE(request.sort[0].is_ascending());
  EXPECT_THAT(request.fetch_keys, Contains("kMDItemFSSize"));
  EXPECT_THAT(request.fetch_keys, Contains("kMDItemPath"));
  EXPECT_EQ(query->state(), QueryState::Gathering);
}

TEST_F(MetadataQueryTest, DefaultPredicateMatchesAllItems) {
  auto query = make_query();

  EXPECT_EQ(query->predicate_format(), "kMDItemContentTypeTree == \"public.item\"");
}

TEST_F(MetadataQueryTest, GatheringDeliversAllResultsOnce) {
  // Arrange
  auto query = make_query();
  query->start();

  // Act
  backend_.simulate_gathering({1, 2, 3});

  // Assert
  ASSERT_EQ(recorder_.count(), 1u);
  EXPECT_THAT(TestUtilities::ids_of(recorder_.last().items), ElementsAre(1u, 2u, 3u));
  EXPECT_THAT(TestUtilities::ids_of(recorder_.last().diff.added), ElementsAre(1u, 2u, 3u));
  EXPECT_THAT(TestUtilities::ids_of(query->results()), ElementsAre(1u, 2u, 3u));
  EXPECT_EQ(query->state(), QueryState::Stopped);
}

TEST_F(MetadataQueryTest, MonitoringDeliversLiveUpdates) {
  // Arrange
  auto query = make_query(true);
  EXPECT_CALL(backend_, enable_live_updates(1)).Times(1);
  query->start();
  backend_.simulate_gathering({1, 2, 3});
  ASSERT_EQ(query->state(), QueryState::Monitoring);

  // Act
  backend_.simulate_update({4}, {1}, {});

  // Assert
  ASSERT_EQ(recorder_.count(), 2u);
  auto delivery = recorder_.last();
  EXPECT_THAT(TestUtilities::ids_of(delivery.items), ElementsAre(2u, 3u, 4u));
  EXPECT_THAT(TestUtilities::ids_of(delivery.diff.added), ElementsAre(4u));
  EXPECT_THAT(TestUtilities::ids_of(delivery.diff.removed), ElementsAre(1u));
}

TEST_F(MetadataQueryTest, ChangingThePredicateRestartsTheQuery) {
  // Arrange
  auto query = make_query(true);
  query->start();
  backend_.simulate_gathering({1, 2});
  std::string before = query->predicate_format();

  // Act
  query->set_predicate(PredicateRoot{}.file_name().contains("todo"));

  // Assert
  EXPECT_THAT(backend_.cancelled(), Contains(1u));
  EXPECT_EQ(backend_.submit_count(), 2);
  EXPECT_EQ(backend_.current_handle(), 2u);
  EXPECT_NE(query->predicate_format(), before);
  EXPECT_EQ(backend_.last_request().query, "kMDItemFSName == \"*todo*\"cd");
  EXPECT_THAT(query->results(), IsEmpty());
  EXPECT_EQ(query->state(), QueryState::Gathering);

  backend_.simulate_gathering({4});
  EXPECT_THAT(TestUtilities::ids_of(recorder_.last().items), ElementsAre(4u));
}

TEST_F(MetadataQueryTest, EventsFromASupersededRequestAreIgnored) {
  // Arrange
  auto query = make_query(true);
  query->start();
  backend_.simulate_gathering({1, 2});
  auto stale_handler = backend_.handler_for(1);
  query->set_search_locations({"/Users/tester/Desktop"});
  backend_.simulate_gathering({3});
  size_t deliveries = recorder_.count();

  // Act
  BackendEvent stale;
  stale.kind = BackendEventKind::ResultsUpdated;
  stale.handle = 1;
  stale.added = {4};
  stale_handler(stale);

  // Assert
  EXPECT_EQ(recorder_.count(), deliveries);
  EXPECT_THAT(TestUtilities::ids_of(query->results()), ElementsAre(3u));
}

TEST_F(MetadataQueryTest, InvalidPredicateLeavesTheQueryUnchanged) {
  // Arrange
  auto query = make_query(true);
  query->start();
  std::string before = query->predicate_format();

  // Act & Assert
  EXPECT_THROW(query->set_predicate([](const PredicateRoot& item) {
    return item.file_size().between(5, 1);
  }),
               PredicateError);
  EXPECT_EQ(query->predicate_format(), before);
  EXPECT_EQ(backend_.submit_count(), 1);
}

TEST_F(MetadataQueryTest, PathSortIsRejected) {
  auto query = make_query();

  EXPECT_THROW(query->set_sort({SortDescriptor::ascending(AttributeId::Path)}), QueryConfigError);
  EXPECT_THAT(query->sort(), IsEmpty());
}

TEST_F(MetadataQueryTest, StopCancelsWithoutAFinalCallback) {
  // Arrange
  auto query = make_query(true);
  query->start();
  backend_.simulate_progress({1, 2});
  auto handler = backend_.handler_for(1);

  // Act
  query->stop();
  BackendEvent finished;
  finished.kind = BackendEventKind::GatheringFinished;
  finished.handle = 1;
  handler(finished);

  // Assert
  EXPECT_THAT(backend_.cancelled(), ElementsAre(1u));
  EXPECT_EQ(query->state(), QueryState::Stopped);
  EXPECT_EQ(recorder_.count(), 0u);
}

TEST_F(MetadataQueryTest, StartWhileRunningIsANoOp) {
  auto query = make_query(true);

  query->start();
  query->start();

  EXPECT_EQ(backend_.submit_count(), 1);
}

TEST_F(MetadataQueryTest, MonitoringCanBeToggledAfterGathering) {
  // Arrange
  auto query = make_query(false);
  query->start();
  backend_.simulate_gathering({1});
  ASSERT_EQ(query->state(), QueryState::Stopped);
  EXPECT_CALL(backend_, enable_live_updates(1)).Times(1);
  EXPECT_CALL(backend_, disable_live_updates(1)).Times(1);

  // Act
  query->set_monitor_results(true);
  QueryState while_monitoring = query->state();
  backend_.simulate_update({2}, {}, {});
  query->set_monitor_results(false);

  // Assert
  EXPECT_EQ(while_monitoring, QueryState::Monitoring);
  EXPECT_EQ(query->state(), QueryState::Stopped);
  ASSERT_EQ(recorder_.count(), 2u);
  EXPECT_THAT(TestUtilities::ids_of(recorder_.last().items), ElementsAre(1u, 2u));
}

TEST_F(MetadataQueryTest, RestartAfterFinishedQueryCancelsTheOldRequest) {
  // Arrange
  auto query = make_query(false);
  query->start();
  backend_.simulate_gathering({1});

  // Act
  query->start();

  // Assert
  EXPECT_THAT(backend_.cancelled(), ElementsAre(1u));
  EXPECT_EQ(backend_.submit_count(), 2);
}

TEST_F(MetadataQueryTest, BatchingPolicyIsForwardedToTheBackend) {
  // Arrange
  auto query = make_query(true);
  BatchingPolicy policy;
  policy.monitoring_interval = std::chrono::milliseconds(250);
  EXPECT_CALL(backend_, set_batching(1, _)).Times(2);

  // Act
  query->start();
  query->set_batching_policy(policy);

  // Assert
  EXPECT_EQ(query->batching_policy(), policy);
}

TEST_F(MetadataQueryTest, SubmitFailureLeavesTheQueryStopped) {
  // Arrange
  auto query = make_query();
  EXPECT_CALL(backend_, submit(_, _)).WillOnce(Throw(std::runtime_error("backend offline")));

  // Act & Assert
  EXPECT_THROW(query->start(), std::runtime_error);
  EXPECT_EQ(query->state(), QueryState::Stopped);
}

TEST_F(MetadataQueryTest, StartFailureLeavesTheQueryStopped) {
  // Arrange
  auto query = make_query();
  EXPECT_CALL(backend_, start(_))
      .WillOnce(Throw(std::runtime_error("index unavailable")))
      .WillRepeatedly(Return());

  // Act
  EXPECT_THROW(query->start(), std::runtime_error);
  QueryState after_failure = query->state();
  std::vector<RequestHandle> cancelled = backend_.cancelled();
  query->start();

  // Assert
  EXPECT_EQ(after_failure, QueryState::Stopped);
  EXPECT_THAT(cancelled, ElementsAre(1u));
  EXPECT_EQ(backend_.submit_count(), 2);
  EXPECT_EQ(query->state(), QueryState::Gathering);
}

TEST_F(MetadataQueryTest, GroupedResultsFollowTheGroupingAttributes) {
  // Arrange
  backend_.set_value(2, "kMDItemContentType", std::string("net.daringfireball.markdown"));
  auto query = make_query();
  query->set_attributes({AttributeId::FileName});
  query->set_grouping({AttributeId::ContentType, AttributeId::ContentType});
  query->start();
  backend_.simulate_gathering({1, 2, 3});

  // Act
  auto groups = query->grouped_results();

  // Assert
  EXPECT_THAT(query->grouping(), ElementsAre(AttributeId::ContentType));
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].value, AttributeValue{std::string("public.plain-text")});
  EXPECT_THAT(TestUtilities::ids_of(groups[0].items), ElementsAre(1u, 3u));
  EXPECT_THAT(TestUtilities::ids_of(groups[1].items), ElementsAre(2u));
}

TEST_F(MetadataQueryTest, HierarchicalResultsUseTheCommonFolder) {
  // Arrange
  auto query = make_query();
  query->start();
  backend_.simulate_gathering({1, 2, 3});

  // Act
  HierarchicalResults tree = query->hierarchical_results();

  // Assert
  EXPECT_EQ(tree.top_level_path(), "/Users/tester/Documents");
  EXPECT_EQ(tree.files().size(), 2u);
  ASSERT_EQ(tree.folders().size(), 1u);
  EXPECT_EQ(tree.folders()[0]->name, "Archive");
  ASSERT_NE(tree.item_at("/Users/tester/Documents/Archive/old-report.txt"), nullptr);
  EXPECT_EQ(tree.item_at("/Users/tester/Documents/Archive/old-report.txt")->id(), 3u);
}

}  // namespace mdquery_tests
