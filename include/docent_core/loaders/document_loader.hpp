#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace docent_core {

class LoaderError : public std::exception {
 public:
  explicit LoaderError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised by the registry when no loader is registered for an extension.
class UnsupportedFormatError : public LoaderError {
 public:
  using LoaderError::LoaderError;
};

// Turns one file format into plain text.
class DocumentLoader {
 public:
  virtual ~DocumentLoader() = default;

  // Lowercase extensions including the dot, e.g. ".pdf"
  virtual std::vector<std::string> extensions() const = 0;

  virtual std::string name() const = 0;

  // Reads the whole file and returns its text. Throws LoaderError when the
  // file cannot be read or is not a valid instance of the format.
  virtual std::string load(const fs::path &file_path) const = 0;

 protected:
  static std::string read_file_bytes(const fs::path &file_path);
  // Replaces invalid UTF-8 sequences and drops a leading byte order mark
  static std::string sanitize_utf8(const std::string &text);
};

using DocumentLoaderPtr = std::shared_ptr<DocumentLoader>;

}  // namespace docent_core
