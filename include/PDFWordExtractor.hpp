#ifndef OUTLINE_PDF_WORD_EXTRACTOR_HPP
#define OUTLINE_PDF_WORD_EXTRACTOR_HPP

#include "OutlineTypes.hpp"

#include <string>
#include <vector>

namespace outline {

class EventRecorder;

/**
 * @brief Result of extracting positioned words from a PDF
 */
struct PDFExtractionResult {
  bool success = false;          ///< Whether the document could be read
  std::string errorMessage;      ///< Error message if failed
  std::vector<PageContent> pages; ///< Words of every processed page
  int pageCount = 0;             ///< Number of pages in the document
  double processingTimeMs = 0;   ///< Processing time in milliseconds
};

/**
 * @brief Extracts words with bounding boxes and fonts using Poppler
 *
 * Coordinates use a top-left origin in points, matching the layout
 * expected by BlockGrouper. Scanned pages without a text layer simply yield
 * no words.
 */
class PDFWordExtractor {
public:
  /**
   * @brief Constructor
   * @param recorder Optional event sink, not owned
   */
  explicit PDFWordExtractor(EventRecorder *recorder = nullptr);

  /**
   * @brief Extract the words of a PDF file
   *
   * Never throws. A page that cannot be read is skipped and reported.
   *
   * @param pdfPath Path to the PDF file
   * @param firstPage 1-indexed first page to process
   * @param lastPage 1-indexed last page to process, -1 for the last page
   * @return PDFExtractionResult with one PageContent per processed page
   */
  PDFExtractionResult extract(const std::string &pdfPath, int firstPage = 1,
                              int lastPage = -1) const;

private:
  EventRecorder *m_recorder;
};

} // namespace outline

#endif // OUTLINE_PDF_WORD_EXTRACTOR_HPP
