#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docent_core/db/database_manager.hpp"
#include "docent_core/db/index_store.hpp"
#include "docent_core/llm/embedding_gateway.hpp"
#include "docent_core/types/chunk.hpp"

namespace docent_tests {

// Vector length used by every test database
inline constexpr int TEST_DIMENSION = 8;
inline constexpr const char *TEST_DB_KEY = "docent_test_key";

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path &db_path);

  // Scratch directory for loader input files, removed with remove_all
  static std::filesystem::path create_temp_dir(const std::string &prefix);

  // Test data creation
  static std::vector<float> create_test_vector(const std::string &seed_text,
                                               int dimension = TEST_DIMENSION);

  // Unit vector along `axis`, optionally tilted towards `tilt_axis`
  static std::vector<float> axis_vector(int axis,
                                        int dimension = TEST_DIMENSION,
                                        int tilt_axis = -1,
                                        float tilt = 0.0f);

  static docent_core::Chunk create_test_chunk(const std::string &content,
                                              int chunk_index,
                                              std::vector<float> embedding,
                                              const docent_core::Metadata &metadata);

  static void write_file(const std::filesystem::path &path, const std::string &content);

  // Minimal Office Open XML package holding only word/document.xml
  static void write_docx(const std::filesystem::path &path, const std::string &document_xml);
};

/**
 * Embedding gateway that hashes words into buckets: texts sharing words end
 * up close, unrelated texts far apart. Deterministic and offline.
 */
class KeywordEmbeddingGateway : public docent_core::EmbeddingGateway {
 public:
  explicit KeywordEmbeddingGateway(int dimension = TEST_DIMENSION) : dimension_(dimension) {}

  std::vector<float> get_embedding(const std::string &text) override;

  size_t calls() const {
    return calls_.load();
  }

 private:
  int dimension_;
  std::atomic<size_t> calls_{0};
};

/**
 * Base test fixture that provides a fresh encrypted IndexStore per test
 */
class IndexStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_shared<docent_core::DatabaseManager>();
    db_manager_->initialize(temp_db_path_, TEST_DB_KEY, /*pool_size*/ 4);
    index_store_ = std::make_shared<docent_core::IndexStore>(db_manager_, TEST_DIMENSION);
  }

  void TearDown() override {
    index_store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::shared_ptr<docent_core::DatabaseManager> db_manager_;
  std::shared_ptr<docent_core::IndexStore> index_store_;
};

}  // namespace docent_tests
