#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docent_core/llm/ollama_client.hpp"

namespace docent_core {

TEST(OllamaReplyParserTest, AnswerObjectIsFinal) {
  auto turn = OllamaClient::parse_model_reply(R"({"answer": "Twenty days."})");
  EXPECT_TRUE(turn.is_final());
  EXPECT_EQ(turn.content, "Twenty days.");
}

TEST(OllamaReplyParserTest, PlainTextIsFinal) {
  auto turn = OllamaClient::parse_model_reply("You get twenty days of leave.");
  EXPECT_TRUE(turn.is_final());
  EXPECT_EQ(turn.content, "You get twenty days of leave.");
}

TEST(OllamaReplyParserTest, ToolCallListIsParsedInOrder) {
  auto turn = OllamaClient::parse_model_reply(
      R"({"tool_calls": [
            {"name": "search_documents", "arguments": {"query": "leave"}},
            {"name": "fetch_user_data", "arguments": {"user_id": "u1", "data_type": "profile"}}
          ]})");

  ASSERT_EQ(turn.tool_calls.size(), 2u);
  EXPECT_FALSE(turn.is_final());
  EXPECT_EQ(turn.tool_calls[0].name, "search_documents");
  EXPECT_EQ(turn.tool_calls[0].arguments["query"], "leave");
  EXPECT_EQ(turn.tool_calls[1].name, "fetch_user_data");
  EXPECT_EQ(turn.tool_calls[1].arguments["data_type"], "profile");
  EXPECT_TRUE(turn.content.empty());
}

TEST(OllamaReplyParserTest, SingleToolShapeIsAccepted) {
  auto turn = OllamaClient::parse_model_reply(
      R"({"tool": "search_chat_history", "arguments": {"query": "leave"}})");

  ASSERT_EQ(turn.tool_calls.size(), 1u);
  EXPECT_EQ(turn.tool_calls[0].name, "search_chat_history");
  EXPECT_EQ(turn.tool_calls[0].arguments["query"], "leave");
}

TEST(OllamaReplyParserTest, DoubleEncodedArgumentsAreDecoded) {
  auto turn = OllamaClient::parse_model_reply(
      R"({"tool_calls": [{"name": "search_documents", "arguments": "{\"query\": \"leave\"}"}]})");

  ASSERT_EQ(turn.tool_calls.size(), 1u);
  EXPECT_EQ(turn.tool_calls[0].arguments["query"], "leave");
}

TEST(OllamaReplyParserTest, NamelessCallsAreSkipped) {
  auto turn = OllamaClient::parse_model_reply(
      R"({"tool_calls": [{"arguments": {}}, 42, {"name": "create_api_response"}]})");

  ASSERT_EQ(turn.tool_calls.size(), 1u);
  EXPECT_EQ(turn.tool_calls[0].name, "create_api_response");
  EXPECT_TRUE(turn.tool_calls[0].arguments.is_object());
  EXPECT_TRUE(turn.tool_calls[0].arguments.empty());
}

TEST(OllamaReplyParserTest, ThinkingTextTravelsWithToolCalls) {
  auto turn = OllamaClient::parse_model_reply(
      R"({"content": "Let me check.", "tool_calls": [{"name": "search_documents", "arguments": {"query": "x"}}]})");

  EXPECT_FALSE(turn.is_final());
  EXPECT_EQ(turn.content, "Let me check.");
}

TEST(OllamaReplyParserTest, UnrecognisedObjectBecomesAnswer) {
  auto turn = OllamaClient::parse_model_reply(R"({"days": 20})");
  EXPECT_TRUE(turn.is_final());
  EXPECT_EQ(turn.content, R"({"days":20})");
}

TEST(OllamaReplyParserTest, ProtocolPromptListsTools) {
  std::vector<ToolSpec> tools{
      ToolSpec{.name = "search_documents", .description = "Search official documents"}};

  const std::string prompt = OllamaClient::tool_protocol_prompt(tools);
  EXPECT_NE(prompt.find("\"tool_calls\""), std::string::npos);
  EXPECT_NE(prompt.find("search_documents"), std::string::npos);
  EXPECT_NE(prompt.find("Search official documents"), std::string::npos);

  EXPECT_NE(OllamaClient::tool_protocol_prompt({}).find("No tools are available"),
            std::string::npos);
}

TEST(OllamaClientTest, UnreachableServerIsRejected) {
  OllamaOptions options;
  options.url = "http://127.0.0.1:1";
  options.read_timeout_seconds = 1;
  EXPECT_THROW(OllamaClient client(options), OllamaError);
}

}  // namespace docent_core
