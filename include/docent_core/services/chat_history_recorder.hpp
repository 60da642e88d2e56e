#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docent_core/services/ingestion_service.hpp"

namespace docent_core {

struct RecordResult {
  bool success;
  std::vector<ChunkId> chunk_ids;
  std::string error_message;

  static RecordResult success_response(std::vector<ChunkId> ids) {
    return {true, std::move(ids), ""};
  }

  static RecordResult failure_response(const std::string &error) {
    return {false, {}, error};
  }
};

// Writes finished exchanges back into the index so later questions can find
// them through the chat history search.
class ChatHistoryRecorder {
 public:
  explicit ChatHistoryRecorder(std::shared_ptr<IngestionService> ingestion_service);
  virtual ~ChatHistoryRecorder() = default;

  // Never throws for ingestion failures; they are logged and reported in the
  // result. The department defaults to "general".
  virtual RecordResult record(const std::string &query,
                              const std::string &answer,
                              const std::string &user_id,
                              const std::optional<std::string> &department);

  static std::string format_exchange(const std::string &query, const std::string &answer);

 private:
  static std::string current_timestamp();

  std::shared_ptr<IngestionService> ingestion_service_;
};

}  // namespace docent_core
