#include "docent_core/loaders/office_document_loader.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <utf8.h>

#include <cstdint>
#include <iterator>
#include <memory>
#include <regex>

namespace docent_core {

namespace {

constexpr const char *DOCUMENT_PART = "word/document.xml";

using ArchivePtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

std::string decode_entities(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '&') {
      out.push_back(text[pos++]);
      continue;
    }
    const size_t semi = text.find(';', pos);
    if (semi == std::string::npos || semi - pos > 10) {
      out.push_back(text[pos++]);
      continue;
    }
    const std::string entity = text.substr(pos + 1, semi - pos - 1);
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos") {
      out.push_back('\'');
    } else if (entity.size() > 1 && entity[0] == '#') {
      try {
        const bool hex = entity[1] == 'x' || entity[1] == 'X';
        const unsigned long code_point =
            std::stoul(entity.substr(hex ? 2 : 1), nullptr, hex ? 16 : 10);
        utf8::append(static_cast<uint32_t>(code_point), std::back_inserter(out));
      } catch (const std::exception &) {
        // Malformed or out-of-range reference: keep it verbatim
        out.append(text, pos, semi - pos + 1);
      }
    } else {
      out.append(text, pos, semi - pos + 1);
    }
    pos = semi + 1;
  }
  return out;
}

}  // namespace

std::string OfficeDocumentLoader::read_zip_entry(const fs::path &file_path,
                                                 const std::string &entry_name) {
  ArchivePtr archive(archive_read_new(), &archive_read_free);
  if (!archive) {
    throw LoaderError("Failed to allocate archive reader");
  }
  archive_read_support_format_zip(archive.get());

  if (archive_read_open_filename(archive.get(), file_path.string().c_str(), 10240) != ARCHIVE_OK) {
    const char *error = archive_error_string(archive.get());
    throw LoaderError("Not a readable OOXML container: " + file_path.string() + ": " +
                      (error ? error : "unknown archive error"));
  }

  struct archive_entry *entry = nullptr;
  int r = ARCHIVE_OK;
  while ((r = archive_read_next_header(archive.get(), &entry)) == ARCHIVE_OK) {
    const char *pathname = archive_entry_pathname(entry);
    if (!pathname || entry_name != pathname) {
      archive_read_data_skip(archive.get());
      continue;
    }

    std::string data;
    char buffer[8192];
    la_ssize_t n = 0;
    while ((n = archive_read_data(archive.get(), buffer, sizeof(buffer))) > 0) {
      data.append(buffer, static_cast<size_t>(n));
    }
    if (n < 0) {
      const char *error = archive_error_string(archive.get());
      throw LoaderError("Failed to read " + entry_name + " from " + file_path.string() + ": " +
                        (error ? error : "unknown archive error"));
    }
    archive_read_close(archive.get());
    return data;
  }

  if (r != ARCHIVE_EOF) {
    const char *error = archive_error_string(archive.get());
    throw LoaderError("Not a readable OOXML container: " + file_path.string() + ": " +
                      (error ? error : "unknown archive error"));
  }
  throw LoaderError("No " + entry_name + " part in " + file_path.string());
}

std::string OfficeDocumentLoader::text_from_document_xml(const std::string &xml) {
  std::string text = std::regex_replace(xml, std::regex("</w:p>"), "\n");
  text = std::regex_replace(text, std::regex("<w:tab\\s*/>"), "\t");
  text = std::regex_replace(text, std::regex("<w:(br|cr)\\s*/>"), "\n");
  text = std::regex_replace(text, std::regex("<[^>]*>"), "");
  text = decode_entities(text);

  const size_t start = text.find_first_not_of(" \n\t");
  const size_t end = text.find_last_not_of(" \n\t");
  if (start == std::string::npos) {
    return "";
  }
  return text.substr(start, end - start + 1);
}

std::string OfficeDocumentLoader::load(const fs::path &file_path) const {
  if (!fs::exists(file_path)) {
    throw LoaderError("Could not open file: " + file_path.string());
  }
  return sanitize_utf8(text_from_document_xml(read_zip_entry(file_path, DOCUMENT_PART)));
}

}  // namespace docent_core
