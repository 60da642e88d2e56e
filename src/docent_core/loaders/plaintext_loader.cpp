#include "docent_core/loaders/plaintext_loader.hpp"

namespace docent_core {

std::string PlainTextLoader::load(const fs::path &file_path) const {
  return sanitize_utf8(read_file_bytes(file_path));
}

}  // namespace docent_core
