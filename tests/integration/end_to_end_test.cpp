#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docent_core/agent/tool_orchestrator.hpp"
#include "docent_core/agent/tools/chat_history_search_tool.hpp"
#include "docent_core/agent/tools/document_search_tool.hpp"
#include "docent_core/agent/tools/response_format_tool.hpp"
#include "docent_core/loaders/loader_registry.hpp"
#include "docent_core/services/chat_history_recorder.hpp"
#include "docent_core/services/ingestion_service.hpp"
#include "docent_core/services/retrieval_service.hpp"
#include "../common/mocks_test.hpp"
#include "../common/utilities_test.hpp"

namespace docent_core {

using docent_tests::MockUtilities::final_turn;
using docent_tests::MockUtilities::tool_turn;
using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;

// Ingest files, ask a question through the orchestrator with a scripted model,
// and check that citations and recorded history come from the real index.
class EndToEndTest : public docent_tests::IndexStoreTestBase {
 protected:
  void SetUp() override {
    IndexStoreTestBase::SetUp();
    docs_dir_ = docent_tests::TestUtilities::create_temp_dir("docs");

    gateway_ = std::make_shared<docent_tests::KeywordEmbeddingGateway>();
    ingestion_ = std::make_shared<IngestionService>(
        index_store_, gateway_, LoaderRegistry::create_default(),
        IngestionOptions{.chunker = {.chunk_size = 200, .chunk_overlap = 20}});
    retrieval_ = std::make_shared<RetrievalService>(index_store_, gateway_);
    recorder_ = std::make_shared<ChatHistoryRecorder>(ingestion_);

    registry_ = std::make_shared<ToolRegistry>();
    registry_->register_tool(std::make_shared<DocumentSearchTool>(retrieval_));
    registry_->register_tool(std::make_shared<ChatHistorySearchTool>(retrieval_));
    registry_->register_tool(std::make_shared<ResponseFormatTool>());

    model_ = std::make_shared<docent_tests::MockChatModel>();
    user_.user_id = "u42";
    user_.department = "hr";
  }

  void TearDown() override {
    std::filesystem::remove_all(docs_dir_);
    IndexStoreTestBase::TearDown();
  }

  std::filesystem::path write_doc(const std::string &name, const std::string &content) {
    auto path = docs_dir_ / name;
    docent_tests::TestUtilities::write_file(path, content);
    return path;
  }

  void ingest_library() {
    ingestion_->ingest_file(
        write_doc("leave_policy.txt",
                  "Annual leave policy. Every employee receives twenty days of annual leave "
                  "per calendar year."),
        "hr", "policy");
    ingestion_->ingest_file(
        write_doc("parking.txt", "Parking permits are issued by the facilities office."),
        "facilities", "procedure");
  }

  std::unique_ptr<ToolOrchestrator> make_orchestrator() {
    return std::make_unique<ToolOrchestrator>(model_, registry_, recorder_, OrchestratorConfig{},
                                              user_);
  }

  std::filesystem::path docs_dir_;
  std::shared_ptr<docent_tests::KeywordEmbeddingGateway> gateway_;
  std::shared_ptr<IngestionService> ingestion_;
  std::shared_ptr<RetrievalService> retrieval_;
  std::shared_ptr<ChatHistoryRecorder> recorder_;
  std::shared_ptr<ToolRegistry> registry_;
  std::shared_ptr<docent_tests::MockChatModel> model_;
  UserContext user_;
};

TEST_F(EndToEndTest, AnswerCitesRetrievedDocument) {
  ingest_library();

  std::vector<ChatMessage> second_call;
  EXPECT_CALL(*model_, chat(_, _))
      .WillOnce(Return(tool_turn({ToolCall{
          .name = "search_documents",
          .arguments = {{"query", "annual leave days"}, {"department", "hr"}}}})))
      .WillOnce(DoAll(SaveArg<0>(&second_call),
                      Return(final_turn("Employees receive twenty days of annual leave."))));

  auto result = make_orchestrator()->query("How many days of annual leave do I get?");

  ASSERT_TRUE(result.success) << result.response;
  EXPECT_EQ(result.response, "Employees receive twenty days of annual leave.");
  ASSERT_EQ(result.sources.size(), 1u);
  EXPECT_EQ(result.sources[0].filename, "leave_policy.txt");
  EXPECT_EQ(result.sources[0].department, "hr");
  EXPECT_EQ(result.sources[0].document_type, "policy");
  EXPECT_EQ(result.sources[0].source, (docs_dir_ / "leave_policy.txt").string());

  ASSERT_FALSE(second_call.empty());
  EXPECT_THAT(second_call.back().content, HasSubstr("twenty days of annual leave"));
  EXPECT_THAT(second_call.back().content, HasSubstr("[Source: leave_policy.txt]"));
}

TEST_F(EndToEndTest, LongDocumentYieldsSingleSource) {
  std::string policy;
  while (policy.size() < 2500) {
    policy += "Overtime worked on public holidays is compensated at double the hourly rate. ";
  }
  policy.resize(2500);
  ingestion_->ingest_file(write_doc("overtime.txt", policy), "hr", "policy");
  ingestion_->ingest_file(write_doc("it_policy.txt", "Overtime for on-call IT staff is paid."),
                          "it", "policy");

  EXPECT_CALL(*model_, chat(_, _))
      .WillOnce(Return(tool_turn({ToolCall{
          .name = "search_documents",
          .arguments = {{"query", "overtime public holidays"}, {"department", "hr"}}}})))
      .WillOnce(Return(final_turn("Double the hourly rate.")));

  auto result = make_orchestrator()->query("How is holiday overtime paid?");

  ASSERT_TRUE(result.success);
  EXPECT_GT(index_store_->count_chunks({{metadata_keys::FILENAME, "overtime.txt"}}), 1u);
  ASSERT_EQ(result.sources.size(), 1u);
  EXPECT_EQ(result.sources[0].filename, "overtime.txt");
}

TEST_F(EndToEndTest, ExchangeIsRecordedForTheUserOnly) {
  ingest_library();
  EXPECT_CALL(*model_, chat(_, _))
      .WillOnce(Return(final_turn("Employees receive twenty days of annual leave.")));

  make_orchestrator()->query("How many days of annual leave do I get?");

  auto own_history = retrieval_->search(
      "annual leave", 5, {{metadata_keys::TYPE, CHAT_HISTORY}, {metadata_keys::USER_ID, "u42"}});
  ASSERT_EQ(own_history.size(), 1u);
  EXPECT_THAT(own_history[0].chunk.content,
              HasSubstr("Query: How many days of annual leave do I get?"));
  EXPECT_THAT(own_history[0].chunk.content, HasSubstr("Answer: Employees receive twenty days"));
  EXPECT_EQ(own_history[0].chunk.metadata["department"], "hr");

  auto other_history = retrieval_->search(
      "annual leave", 5, {{metadata_keys::TYPE, CHAT_HISTORY}, {metadata_keys::USER_ID, "u99"}});
  EXPECT_TRUE(other_history.empty());
}

TEST_F(EndToEndTest, RecordedHistoryIsSearchableButNeverCited) {
  EXPECT_CALL(*model_, chat(_, _))
      .WillOnce(Return(final_turn("Twenty days.")))
      .WillOnce(Return(tool_turn({ToolCall{.name = "search_chat_history",
                                           .arguments = {{"query", "annual leave"}}}})))
      .WillOnce(Return(final_turn("As before, twenty days.")));

  auto orchestrator = make_orchestrator();
  orchestrator->query("How much annual leave?");
  auto result = orchestrator->query("Remind me about annual leave?");

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.tools_used, std::vector<std::string>{"search_chat_history"});
  EXPECT_TRUE(result.sources.empty());
}

TEST_F(EndToEndTest, DeletedDocumentIsNoLongerCited) {
  ingest_library();
  EXPECT_EQ(ingestion_->delete_document((docs_dir_ / "leave_policy.txt").string()), 1u);

  EXPECT_CALL(*model_, chat(_, _))
      .WillOnce(Return(tool_turn({ToolCall{
          .name = "search_documents",
          .arguments = {{"query", "annual leave days"}, {"department", "hr"}}}})))
      .WillOnce(Return(final_turn("I could not find that policy.")));

  auto result = make_orchestrator()->query("How many days of annual leave do I get?");

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.sources.empty());
}

}  // namespace docent_core
