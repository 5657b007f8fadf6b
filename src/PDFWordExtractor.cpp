#include "PDFWordExtractor.hpp"

#include "EventRecorder.hpp"

#include <chrono>
#include <memory>
#include <sstream>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

namespace outline {

namespace {

std::string toUtf8(const poppler::ustring &text) {
  poppler::byte_array bytes = text.to_utf8();
  return std::string(bytes.begin(), bytes.end());
}

} // anonymous namespace

PDFWordExtractor::PDFWordExtractor(EventRecorder *recorder)
    : m_recorder(recorder) {}

PDFExtractionResult PDFWordExtractor::extract(const std::string &pdfPath,
                                              int firstPage,
                                              int lastPage) const {
  PDFExtractionResult result;
  result.success = false;

  auto log = [this](EventLevel level, const std::string &message) {
    if (m_recorder)
      m_recorder->recordEvent(level, message);
  };

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    // Load the PDF document using Poppler
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    result.pageCount = doc->pages();
    int first = firstPage > 0 ? firstPage : 1;
    int last = (lastPage > 0 && lastPage < result.pageCount) ? lastPage
                                                              : result.pageCount;

    for (int pageNumber = first; pageNumber <= last; pageNumber++) {
      log(EventLevel::Info, "Processing Page " + std::to_string(pageNumber) +
                                "...");
      try {
        std::unique_ptr<poppler::page> page(doc->create_page(pageNumber - 1));

        if (!page) {
          log(EventLevel::Warning, "Failed to create page " +
                                       std::to_string(pageNumber) +
                                       ", skipping");
          continue;
        }

        PageContent content;
        content.pageNumber = pageNumber;

        poppler::rectf pageRect = page->page_rect();
        if (pageRect.width() > 0 && pageRect.height() > 0) {
          content.width = pageRect.width();
          content.height = pageRect.height();
        }

        // text_list boxes already use a top-left origin
        std::vector<poppler::text_box> textBoxes =
            page->text_list(poppler::page::text_list_include_font);

        for (auto &textBox : textBoxes) {
          std::string text = toUtf8(textBox.text());
          if (text.empty())
            continue;

          poppler::rectf bbox = textBox.bbox();

          WordFragment word;
          word.text = text;
          word.boundingBox =
              cv::Rect2d(bbox.x(), bbox.y(), bbox.width(), bbox.height());
          word.pageNumber = pageNumber;

          std::string fontName = textBox.get_font_name();
          if (fontName != "*ignored*")
            word.fontName = fontName;

          // Some producers report no size; the glyph box height is close
          double fontSize = textBox.get_font_size();
          word.fontSize = fontSize > 0 ? fontSize : bbox.height();

          content.words.push_back(std::move(word));
        }

        std::ostringstream msg;
        msg << "Found " << content.words.size() << " words on page "
            << pageNumber;
        log(EventLevel::Debug, msg.str());

        result.pages.push_back(std::move(content));
      } catch (const std::exception &e) {
        log(EventLevel::Warning, "Exception processing page " +
                                     std::to_string(pageNumber) + ": " +
                                     e.what());
      }
    }

    log(EventLevel::Info,
        "Finished processing all pages for '" + pdfPath + "'.");
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace outline
