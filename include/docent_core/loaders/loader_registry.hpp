#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docent_core/loaders/document_loader.hpp"

namespace docent_core {

/**
 * @class LoaderRegistry
 * @brief Maps file extensions to the DocumentLoader responsible for them.
 *
 * Lookup is by lowercase extension only. There is no catch-all loader: an
 * extension nobody registered is reported as UnsupportedFormatError so that
 * ingestion can refuse the file before reading it.
 */
class LoaderRegistry {
 public:
  LoaderRegistry() = default;

  /**
   * @brief Registry with the loaders for .txt, .pdf, .doc and .docx.
   */
  static std::shared_ptr<LoaderRegistry> create_default();

  // Registers the loader for each of its extensions, replacing earlier ones.
  void register_loader(DocumentLoaderPtr loader);

  /**
   * @brief Returns the loader registered for the file's extension.
   * @throw UnsupportedFormatError if the extension is not registered.
   */
  const DocumentLoader &get_loader_for(const std::filesystem::path &file_path) const;

  bool supports(const std::filesystem::path &file_path) const;

  std::vector<std::string> supported_extensions() const;

  LoaderRegistry(const LoaderRegistry &) = delete;
  LoaderRegistry &operator=(const LoaderRegistry &) = delete;

 private:
  static std::string normalized_extension(const std::filesystem::path &file_path);

  std::map<std::string, DocumentLoaderPtr> loaders_by_extension_;
};

}  // namespace docent_core
