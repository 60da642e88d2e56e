#pragma once

#include <memory>

namespace docent_core {
class IngestionService;
class RetrievalService;
class SessionRegistry;
}  // namespace docent_core

namespace docent_core {

// Long-lived services shared by every command and session.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<IngestionService> ingestion,
                  std::shared_ptr<RetrievalService> retrieval,
                  std::shared_ptr<SessionRegistry> sessions)
      : ingestion_(ingestion), retrieval_(retrieval), sessions_(sessions) {}

  IngestionService &get_ingestion_service() {
    return *ingestion_;
  }
  RetrievalService &get_retrieval_service() {
    return *retrieval_;
  }
  SessionRegistry &get_session_registry() {
    return *sessions_;
  }

 private:
  std::shared_ptr<IngestionService> ingestion_;
  std::shared_ptr<RetrievalService> retrieval_;
  std::shared_ptr<SessionRegistry> sessions_;
};

}  // namespace docent_core
