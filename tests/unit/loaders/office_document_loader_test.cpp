#include <gtest/gtest.h>

#include <filesystem>

#include "docent_core/loaders/office_document_loader.hpp"
#include "../../common/utilities_test.hpp"

namespace docent_core {

using docent_tests::TestUtilities;

class OfficeDocumentLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("docent_office");
  }

  void TearDown() override {
    std::filesystem::remove_all(temp_dir_);
  }

  OfficeDocumentLoader loader_;
  std::filesystem::path temp_dir_;
};

TEST_F(OfficeDocumentLoaderTest, ParagraphsBecomeLines) {
  const std::string xml =
      "<w:document><w:body>"
      "<w:p><w:r><w:t>Expense policy</w:t></w:r></w:p>"
      "<w:p><w:r><w:t xml:space=\"preserve\">Receipts are </w:t></w:r>"
      "<w:r><w:t>required.</w:t></w:r></w:p>"
      "</w:body></w:document>";

  EXPECT_EQ(OfficeDocumentLoader::text_from_document_xml(xml),
            "Expense policy\nReceipts are required.");
}

TEST_F(OfficeDocumentLoaderTest, TabsBreaksAndEntities) {
  const std::string xml =
      "<w:p><w:r><w:t>Name</w:t><w:tab/><w:t>R&amp;D</w:t><w:br/>"
      "<w:t>&lt;draft&gt; &#233;t&#xE9;</w:t></w:r></w:p>";

  EXPECT_EQ(OfficeDocumentLoader::text_from_document_xml(xml),
            "Name\tR&D\n<draft> \xC3\xA9t\xC3\xA9");
}

TEST_F(OfficeDocumentLoaderTest, UnknownEntitiesAreKept) {
  EXPECT_EQ(OfficeDocumentLoader::text_from_document_xml("<w:t>a &nbsp; b &#xZZ;</w:t>"),
            "a &nbsp; b &#xZZ;");
}

TEST_F(OfficeDocumentLoaderTest, LoadsDocxPackage) {
  const auto path = temp_dir_ / "expenses.docx";
  TestUtilities::write_docx(path,
                            "<w:document><w:body><w:p><w:r><w:t>Submit claims monthly."
                            "</w:t></w:r></w:p></w:body></w:document>");

  EXPECT_EQ(loader_.load(path), "Submit claims monthly.");
}

TEST_F(OfficeDocumentLoaderTest, RejectsNonZipFile) {
  const auto path = temp_dir_ / "legacy.doc";
  TestUtilities::write_file(path, std::string("\xD0\xCF\x11\xE0 binary word 97 file"));

  EXPECT_THROW(loader_.load(path), LoaderError);
}

TEST_F(OfficeDocumentLoaderTest, RejectsMissingFile) {
  EXPECT_THROW(loader_.load(temp_dir_ / "missing.docx"), LoaderError);
}

}  // namespace docent_core
