#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "docent_core/types/metadata.hpp"

namespace docent_core {

class ContentHashError : public std::exception {
 public:
  explicit ContentHashError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

// Identity of an ingestion request: the text plus its caller metadata.
// nlohmann::json objects keep their keys sorted, so dump() is canonical.
std::string document_fingerprint(std::string_view text, const Metadata &metadata);

}  // namespace docent_core
