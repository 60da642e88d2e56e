#include "docent_core/loaders/document_loader.hpp"

#include <utf8.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace docent_core {

std::string DocumentLoader::read_file_bytes(const fs::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw LoaderError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw LoaderError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string DocumentLoader::sanitize_utf8(const std::string &text) {
  std::string clean;
  clean.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
  if (utf8::starts_with_bom(clean.begin(), clean.end())) {
    clean.erase(0, 3);
  }
  return clean;
}

}  // namespace docent_core
