#include "docent_core/loaders/pdf_loader.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <iostream>
#include <regex>
#include <sstream>

namespace docent_core {

namespace {

class PageTextCallbacks : public QPDFObjectHandle::ParserCallbacks {
 public:
  explicit PageTextCallbacks(std::stringstream &text) : text_(text) {}

  // Operands arrive before their operator, so strings are buffered until the
  // operator tells us whether they are shown text.
  void handleObject(QPDFObjectHandle obj) override {
    if (!obj.isOperator()) {
      operands_.push_back(obj);
      return;
    }
    const std::string op = obj.getOperatorValue();
    if (op == "Tj" || op == "'" || op == "\"") {
      for (auto &operand : operands_) {
        if (operand.isString()) {
          text_ << operand.getUTF8Value();
        }
      }
      text_ << (op == "Tj" ? " " : "\n");
    } else if (op == "TJ") {
      for (auto &operand : operands_) {
        if (!operand.isArray()) {
          continue;
        }
        for (auto &item : operand.getArrayAsVector()) {
          if (item.isString()) {
            text_ << item.getUTF8Value();
          }
        }
      }
      text_ << " ";
    } else if (op == "T*" || op == "Td" || op == "TD" || op == "ET") {
      text_ << "\n";
    }
    operands_.clear();
  }

  void handleEOF() override {}

 private:
  std::stringstream &text_;
  std::vector<QPDFObjectHandle> operands_;
};

}  // namespace

std::string PdfLoader::load(const fs::path &file_path) const {
  std::stringstream text;
  try {
    QPDF pdf;
    pdf.processFile(file_path.string().c_str());

    QPDFPageDocumentHelper dh(pdf);
    int page_number = 0;
    for (auto &page : dh.getAllPages()) {
      ++page_number;
      std::stringstream page_text;
      try {
        PageTextCallbacks callbacks(page_text);
        page.parsePageContents(&callbacks);
      } catch (const std::exception &e) {
        // One unreadable content stream should not lose the rest of the document
        std::cerr << "Warning: failed to extract text of page " << page_number << " in "
                  << file_path << ": " << e.what() << std::endl;
      }
      text << page_text.str() << "\n\n";
    }
  } catch (const std::exception &e) {
    throw LoaderError("Failed to read PDF " + file_path.string() + ": " + e.what());
  }
  return sanitize_utf8(clean_text(text.str()));
}

std::string PdfLoader::clean_text(const std::string &raw_text) {
  std::string cleaned = std::regex_replace(raw_text, std::regex("[ \\t]+"), " ");
  cleaned = std::regex_replace(cleaned, std::regex("\\r\\n|\\r"), "\n");
  cleaned = std::regex_replace(cleaned, std::regex(" *\\n *"), "\n");
  cleaned = std::regex_replace(cleaned, std::regex("\\n{3,}"), "\n\n");

  const size_t start = cleaned.find_first_not_of(" \n\t");
  const size_t end = cleaned.find_last_not_of(" \n\t");
  if (start == std::string::npos) {
    return "";
  }
  return cleaned.substr(start, end - start + 1);
}

}  // namespace docent_core
