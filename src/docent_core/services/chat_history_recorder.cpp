#include "docent_core/services/chat_history_recorder.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace docent_core {

ChatHistoryRecorder::ChatHistoryRecorder(std::shared_ptr<IngestionService> ingestion_service)
    : ingestion_service_(std::move(ingestion_service)) {}

std::string ChatHistoryRecorder::format_exchange(const std::string &query,
                                                 const std::string &answer) {
  return "Query: " + query + "\nAnswer: " + answer;
}

std::string ChatHistoryRecorder::current_timestamp() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

RecordResult ChatHistoryRecorder::record(const std::string &query,
                                         const std::string &answer,
                                         const std::string &user_id,
                                         const std::optional<std::string> &department) {
  Metadata metadata = {{metadata_keys::TYPE, CHAT_HISTORY},
                       {metadata_keys::USER_ID, user_id},
                       {metadata_keys::DEPARTMENT, department.value_or("general")},
                       {metadata_keys::TIMESTAMP, current_timestamp()}};
  try {
    return RecordResult::success_response(
        ingestion_service_->ingest(format_exchange(query, answer), metadata));
  } catch (const IngestionError &e) {
    std::cerr << "Chat history: failed to record exchange for user " << user_id << " ("
              << to_string(e.kind()) << "): " << e.what() << std::endl;
    return RecordResult::failure_response(e.what());
  } catch (const std::exception &e) {
    std::cerr << "Chat history: failed to record exchange for user " << user_id << ": "
              << e.what() << std::endl;
    return RecordResult::failure_response(e.what());
  }
}

}  // namespace docent_core
