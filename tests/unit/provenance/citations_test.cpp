#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docent_core/provenance/citations.hpp"

namespace docent_core {

TEST(CitationsTest, SourceFromMetadataUsesFilename) {
  auto record = source_from_metadata({{"filename", "leave.pdf"},
                                      {"source", "/srv/docs/upload_123.pdf"},
                                      {"department", "hr"},
                                      {"document_type", "policy"}});

  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->filename, "leave.pdf");
  EXPECT_EQ(record->department, "hr");
  EXPECT_EQ(record->document_type, "policy");
  EXPECT_EQ(record->source, "/srv/docs/upload_123.pdf");
}

TEST(CitationsTest, SourceFromMetadataFallsBackToSourceBasename) {
  auto record = source_from_metadata({{"source", "/srv/docs/vpn_guide.docx"}});

  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->filename, "vpn_guide.docx");
  EXPECT_FALSE(record->department.has_value());
}

TEST(CitationsTest, SourceFromMetadataRejectsUnnamedChunks) {
  EXPECT_FALSE(source_from_metadata({{"department", "hr"}}).has_value());
  EXPECT_FALSE(source_from_metadata({{"filename", "Unknown"}}).has_value());
  EXPECT_FALSE(source_from_metadata(Metadata::object()).has_value());
}

TEST(CitationsTest, StripsLegacyBlock) {
  const std::string answer =
      "You get twenty days.\n\n--- SOURCES ---\n\xE2\x80\xA2 leave.pdf\n\xE2\x80\xA2 faq.pdf\n";

  EXPECT_EQ(strip_legacy_citations(answer), "You get twenty days.");
  EXPECT_EQ(strip_legacy_citations("  plain answer \n"), "plain answer");
}

TEST(CitationsTest, ParsesLegacyBulletsInOrderWithoutDuplicates) {
  const std::string answer =
      "Answer.\n--- SOURCES ---\n\xE2\x80\xA2 leave.pdf\nnot a bullet\n\xE2\x80\xA2 faq.pdf\n"
      "\xE2\x80\xA2 leave.pdf\n\xE2\x80\xA2 Unknown\n";

  auto sources = parse_legacy_citations(answer);

  ASSERT_EQ(sources.size(), 2u);
  EXPECT_EQ(sources[0].filename, "leave.pdf");
  EXPECT_EQ(sources[1].filename, "faq.pdf");
  EXPECT_TRUE(parse_legacy_citations("No block here.").empty());
}

TEST(CitationsTest, StructuredSourcesWinOverLegacyBlock) {
  SourceRecord structured;
  structured.filename = "handbook.pdf";
  structured.department = "hr";

  auto resolved = resolve_citations(
      "Twenty days.\n--- SOURCES ---\n\xE2\x80\xA2 invented.pdf\n", {structured});

  EXPECT_EQ(resolved.answer, "Twenty days.");
  ASSERT_EQ(resolved.sources.size(), 1u);
  EXPECT_EQ(resolved.sources[0], structured);
}

TEST(CitationsTest, LegacyBlockUsedWhenNothingWasRetrieved) {
  auto resolved =
      resolve_citations("Twenty days.\n--- SOURCES ---\n\xE2\x80\xA2 leave.pdf\n", {});

  EXPECT_EQ(resolved.answer, "Twenty days.");
  ASSERT_EQ(resolved.sources.size(), 1u);
  EXPECT_EQ(resolved.sources[0].filename, "leave.pdf");
}

TEST(CitationsTest, NoSourcesAnywhere) {
  auto resolved = resolve_citations("Hello! How can I help?", {});

  EXPECT_EQ(resolved.answer, "Hello! How can I help?");
  EXPECT_TRUE(resolved.sources.empty());
}

}  // namespace docent_core
