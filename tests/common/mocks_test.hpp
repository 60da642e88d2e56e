#pragma once

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "docent_core/llm/chat_model.hpp"
#include "docent_core/llm/embedding_gateway.hpp"
#include "docent_core/portal/user_data_portal.hpp"
#include "docent_core/services/chat_history_recorder.hpp"
#include "docent_core/services/retrieval_service.hpp"

namespace docent_tests {

/**
 * Mock embedding gateway; get_embeddings falls through to get_embedding
 */
class MockEmbeddingGateway : public docent_core::EmbeddingGateway {
 public:
  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string &text), (override));
};

/**
 * Mock generative model
 */
class MockChatModel : public docent_core::ChatModel {
 public:
  MOCK_METHOD(docent_core::ModelTurn,
              chat,
              (const std::vector<docent_core::ChatMessage> &messages,
               const std::vector<docent_core::ToolSpec> &tools),
              (override));
};

/**
 * Mock internal portal
 */
class MockUserDataPortal : public docent_core::UserDataPortal {
 public:
  MOCK_METHOD(bool, is_configured, (), (const, override));
  MOCK_METHOD(nlohmann::json,
              fetch,
              (const std::string &user_id,
               const std::string &data_type,
               const std::string &credential,
               const docent_core::async::CancellationToken &cancel),
              (override));
};

/**
 * Mock retrieval service; the base is never asked to search
 */
class MockRetrievalService : public docent_core::RetrievalService {
 public:
  MockRetrievalService() : docent_core::RetrievalService(nullptr, nullptr) {}

  MOCK_METHOD(std::vector<docent_core::RetrievalHit>,
              search,
              (const std::string &query, int k, const docent_core::MetadataFilter &filter),
              (override));
};

/**
 * Mock chat history recorder
 */
class MockChatHistoryRecorder : public docent_core::ChatHistoryRecorder {
 public:
  MockChatHistoryRecorder() : docent_core::ChatHistoryRecorder(nullptr) {}

  MOCK_METHOD(docent_core::RecordResult,
              record,
              (const std::string &query,
               const std::string &answer,
               const std::string &user_id,
               const std::optional<std::string> &department),
              (override));
};

namespace MockUtilities {

inline docent_core::ModelTurn final_turn(const std::string &answer) {
  return docent_core::ModelTurn{.content = answer, .tool_calls = {}};
}

inline docent_core::ModelTurn tool_turn(std::vector<docent_core::ToolCall> calls) {
  return docent_core::ModelTurn{.content = "", .tool_calls = std::move(calls)};
}

inline docent_core::RetrievalHit make_hit(docent_core::ChunkId id,
                                          const std::string &content,
                                          const docent_core::Metadata &metadata,
                                          float score = 0.9f) {
  docent_core::RetrievalHit hit;
  hit.chunk.id = id;
  hit.chunk.content = content;
  hit.chunk.metadata = metadata;
  hit.score = score;
  return hit;
}

}  // namespace MockUtilities

}  // namespace docent_tests
