#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "docent_core/provenance/query_scope.hpp"

namespace docent_core {

namespace {

SourceRecord source(const std::string &filename,
                    std::optional<std::string> department = std::nullopt) {
  SourceRecord record;
  record.filename = filename;
  record.department = std::move(department);
  return record;
}

}  // namespace

TEST(QueryScopeTest, KeepsFirstSeenOrderWithoutDuplicates) {
  QueryScope scope;

  EXPECT_EQ(scope.record({source("b.pdf"), source("a.pdf"), source("b.pdf")}), 2u);
  EXPECT_FALSE(scope.record(source("a.pdf")));
  EXPECT_TRUE(scope.record(source("c.pdf")));

  auto drained = scope.drain();
  ASSERT_EQ(drained.size(), 3u);
  EXPECT_EQ(drained[0].filename, "b.pdf");
  EXPECT_EQ(drained[1].filename, "a.pdf");
  EXPECT_EQ(drained[2].filename, "c.pdf");
}

TEST(QueryScopeTest, RecordsDifferingInAnyFieldAreDistinct) {
  QueryScope scope;

  EXPECT_TRUE(scope.record(source("policy.pdf", "hr")));
  EXPECT_TRUE(scope.record(source("policy.pdf", "it")));
  EXPECT_EQ(scope.size(), 2u);
}

TEST(QueryScopeTest, IgnoresUnusableFilenames) {
  QueryScope scope;

  EXPECT_FALSE(scope.record(source("")));
  EXPECT_FALSE(scope.record(source("Unknown")));
  EXPECT_TRUE(scope.empty());
}

TEST(QueryScopeTest, DrainEmptiesTheScope) {
  QueryScope scope;
  scope.record(source("a.pdf"));

  EXPECT_EQ(scope.drain().size(), 1u);
  EXPECT_TRUE(scope.empty());
  EXPECT_TRUE(scope.drain().empty());
}

TEST(QueryScopeTest, ResetDiscardsRecords) {
  QueryScope scope;
  scope.record({source("a.pdf"), source("b.pdf")});

  scope.reset();

  EXPECT_TRUE(scope.empty());
}

TEST(QueryScopeTest, SeparateScopesDoNotShareRecords) {
  QueryScope first;
  QueryScope second;

  first.record(source("a.pdf"));

  EXPECT_EQ(first.size(), 1u);
  EXPECT_TRUE(second.empty());
}

TEST(QueryScopeTest, ConcurrentRecordsAreAllKept) {
  QueryScope scope;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&scope, t]() {
      for (int i = 0; i < 50; ++i) {
        scope.record(source("doc_" + std::to_string(t) + "_" + std::to_string(i) + ".pdf"));
        // Every thread also races on one shared name
        scope.record(source("shared.pdf"));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(scope.size(), 4u * 50u + 1u);
}

}  // namespace docent_core
