#pragma once

#include <exception>
#include <string>

namespace docent_core {

// Base for failures of a model capability (embedding or generation).
class LlmError : public std::exception {
 public:
  explicit LlmError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace docent_core
