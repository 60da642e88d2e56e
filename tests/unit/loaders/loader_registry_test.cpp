#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include "docent_core/loaders/loader_registry.hpp"
#include "docent_core/loaders/pdf_loader.hpp"
#include "docent_core/loaders/plaintext_loader.hpp"
#include "../../common/utilities_test.hpp"

namespace docent_core {

using docent_tests::TestUtilities;

class LoaderRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = LoaderRegistry::create_default();
    temp_dir_ = TestUtilities::create_temp_dir("docent_loaders");
  }

  void TearDown() override {
    std::filesystem::remove_all(temp_dir_);
  }

  // Single-page PDF showing `text` with a correct cross-reference table
  static std::string minimal_pdf(const std::string &text) {
    const std::string content = "BT /F1 12 Tf 72 720 Td (" + text + ") Tj ET";
    std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R >>",
        "<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content +
            "\nendstream"};

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
      offsets.push_back(pdf.size());
      pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const size_t xref_offset = pdf.size();
    std::ostringstream xref;
    xref << "xref\n0 " << objects.size() + 1 << "\n0000000000 65535 f \n";
    for (size_t offset : offsets) {
      char line[21];
      std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
      xref << line;
    }
    xref << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R >>\nstartxref\n"
         << xref_offset << "\n%%EOF\n";
    return pdf + xref.str();
  }

  std::shared_ptr<LoaderRegistry> registry_;
  std::filesystem::path temp_dir_;
};

TEST_F(LoaderRegistryTest, DefaultRegistryCoversDocumentFormats) {
  auto extensions = registry_->supported_extensions();
  std::sort(extensions.begin(), extensions.end());

  EXPECT_EQ(extensions, (std::vector<std::string>{".doc", ".docx", ".pdf", ".txt"}));
}

TEST_F(LoaderRegistryTest, LookupIsCaseInsensitive) {
  EXPECT_EQ(registry_->get_loader_for("/docs/Handbook.PDF").name(), "pdf");
  EXPECT_EQ(registry_->get_loader_for("notes.Txt").name(), "plaintext");
  EXPECT_EQ(registry_->get_loader_for("letter.DOCX").name(), "office");
  EXPECT_EQ(registry_->get_loader_for("legacy.doc").name(), "office");
}

TEST_F(LoaderRegistryTest, UnknownExtensionsAreUnsupported) {
  EXPECT_FALSE(registry_->supports("budget.xlsx"));
  EXPECT_FALSE(registry_->supports("README"));
  EXPECT_THROW(registry_->get_loader_for("budget.xlsx"), UnsupportedFormatError);
  EXPECT_THROW(registry_->get_loader_for("README"), UnsupportedFormatError);
}

TEST_F(LoaderRegistryTest, RegisteringReplacesExistingLoader) {
  LoaderRegistry registry;
  EXPECT_THROW(registry.register_loader(nullptr), std::invalid_argument);

  registry.register_loader(std::make_shared<PlainTextLoader>());
  EXPECT_TRUE(registry.supports("a.txt"));
  EXPECT_FALSE(registry.supports("a.pdf"));
}

TEST_F(LoaderRegistryTest, PlainTextLoaderSanitizesInput) {
  const auto path = temp_dir_ / "notes.txt";
  TestUtilities::write_file(path, "\xEF\xBB\xBFLeave notes \xFF end");

  EXPECT_EQ(registry_->get_loader_for(path).load(path), "Leave notes \xEF\xBF\xBD end");
}

TEST_F(LoaderRegistryTest, PlainTextLoaderReportsMissingFile) {
  const auto path = temp_dir_ / "missing.txt";
  EXPECT_THROW(registry_->get_loader_for(path).load(path), LoaderError);
}

TEST_F(LoaderRegistryTest, PdfLoaderExtractsShownText) {
  const auto path = temp_dir_ / "memo.pdf";
  TestUtilities::write_file(path, minimal_pdf("Office closed on Friday"));

  EXPECT_EQ(registry_->get_loader_for(path).load(path), "Office closed on Friday");
}

TEST_F(LoaderRegistryTest, PdfLoaderRejectsNonPdf) {
  const auto path = temp_dir_ / "fake.pdf";
  TestUtilities::write_file(path, "plain words, no objects at all");

  EXPECT_THROW(registry_->get_loader_for(path).load(path), LoaderError);
}

TEST_F(LoaderRegistryTest, PdfCleanTextCollapsesBlanks) {
  EXPECT_EQ(PdfLoader::clean_text("  Hello \t  world \n\n\n\n Next   page  \n"),
            "Hello world\n\nNext page");
}

}  // namespace docent_core
