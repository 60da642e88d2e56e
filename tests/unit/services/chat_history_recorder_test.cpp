#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <regex>
#include <string>

#include "docent_core/services/chat_history_recorder.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docent_core {

using ::testing::_;
using ::testing::Throw;

class ChatHistoryRecorderTest : public docent_tests::IndexStoreTestBase {
 protected:
  void SetUp() override {
    IndexStoreTestBase::SetUp();
    gateway_ = std::make_shared<docent_tests::KeywordEmbeddingGateway>();
    ingestion_ = std::make_shared<IngestionService>(index_store_, gateway_,
                                                    LoaderRegistry::create_default());
    recorder_ = std::make_unique<ChatHistoryRecorder>(ingestion_);
  }

  std::shared_ptr<docent_tests::KeywordEmbeddingGateway> gateway_;
  std::shared_ptr<IngestionService> ingestion_;
  std::unique_ptr<ChatHistoryRecorder> recorder_;
};

TEST_F(ChatHistoryRecorderTest, FormatsExchange) {
  EXPECT_EQ(ChatHistoryRecorder::format_exchange("How many leave days?", "Twenty."),
            "Query: How many leave days?\nAnswer: Twenty.");
}

TEST_F(ChatHistoryRecorderTest, StoresExchangeAsChatHistory) {
  auto result = recorder_->record("How many leave days?", "Twenty.", "u42", std::string("hr"));

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.chunk_ids.size(), 1u);

  auto stored = index_store_->get_chunks(result.chunk_ids);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].content, "Query: How many leave days?\nAnswer: Twenty.");
  EXPECT_EQ(stored[0].metadata["type"], CHAT_HISTORY);
  EXPECT_EQ(stored[0].metadata["user_id"], "u42");
  EXPECT_EQ(stored[0].metadata["department"], "hr");

  const std::string timestamp = stored[0].metadata["timestamp"].get<std::string>();
  EXPECT_TRUE(std::regex_match(timestamp,
                               std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")))
      << timestamp;
}

TEST_F(ChatHistoryRecorderTest, DepartmentDefaultsToGeneral) {
  auto result = recorder_->record("q", "a", "u42", std::nullopt);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(index_store_->get_chunks(result.chunk_ids)[0].metadata["department"], "general");
}

TEST_F(ChatHistoryRecorderTest, RecordedExchangeIsNotAnOfficialDocument) {
  recorder_->record("q", "a", "u42", std::nullopt);

  EXPECT_EQ(index_store_->count_chunks({{"type", OFFICIAL_DOCUMENT}}), 0u);
  EXPECT_EQ(index_store_->count_chunks({{"type", CHAT_HISTORY}, {"user_id", "u42"}}), 1u);
}

TEST_F(ChatHistoryRecorderTest, IngestionFailureIsReportedNotThrown) {
  auto failing = std::make_shared<docent_tests::MockEmbeddingGateway>();
  EXPECT_CALL(*failing, get_embedding(_)).WillRepeatedly(Throw(LlmError("model server down")));
  ChatHistoryRecorder recorder(
      std::make_shared<IngestionService>(index_store_, failing, LoaderRegistry::create_default()));

  RecordResult result;
  EXPECT_NO_THROW(result = recorder.record("q", "a", "u42", std::nullopt));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_EQ(index_store_->count_chunks(), 0u);
}

}  // namespace docent_core
