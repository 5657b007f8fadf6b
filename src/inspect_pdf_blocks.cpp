#include "DocumentOutliner.hpp"
#include "EventRecorder.hpp"
#include "OutlineClassifier.hpp"
#include "OutlineJson.hpp"
#include "PDFWordExtractor.hpp"

#include <iomanip>
#include <iostream>

int main(int argc, char *argv[]) {
  std::cout << "=== PDF Block Inspection ===" << std::endl << std::endl;

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <pdf_file> [--verbose]"
              << std::endl;
    return 1;
  }

  std::string pdfPath = argv[1];
  bool verbose = argc > 2 && std::string(argv[2]) == "--verbose";

  outline::StreamEventRecorder recorder(
      std::cerr, verbose ? outline::EventLevel::Debug
                         : outline::EventLevel::Warning);

  std::cout << "Loading PDF: " << pdfPath << std::endl << std::endl;
  outline::PDFWordExtractor extractor(&recorder);
  outline::PDFExtractionResult extraction = extractor.extract(pdfPath);

  if (!extraction.success) {
    std::cerr << "Failed to extract words: " << extraction.errorMessage
              << std::endl;
    return 1;
  }

  std::cout << "Pages: " << extraction.pageCount << ", extracted in "
            << std::fixed << std::setprecision(2)
            << extraction.processingTimeMs << " ms" << std::endl;

  outline::OutlineConfig config;
  outline::DocumentOutliner outliner(config, &recorder);
  outline::OutlineClassifier classifier(config.classifier);
  std::vector<outline::PageBlocks> pages = outliner.groupPages(extraction.pages);

  double pageWidth = pages.empty() ? outline::kDefaultPageWidth
                                   : pages.front().width;
  double pageHeight = pages.empty() ? outline::kDefaultPageHeight
                                    : pages.front().height;

  // One row per block with the signals used by the classifier
  for (const auto &page : pages) {
    std::cout << std::endl
              << "[Page " << page.pageNumber << "] " << page.blocks.size()
              << " blocks (" << page.width << " x " << page.height << ")"
              << std::endl;
    std::cout << std::string(80, '-') << std::endl;

    for (const auto &block : page.blocks) {
      outline::HeadingFeatures features =
          classifier.extractFeatures(block, pageWidth);
      std::string flags;
      if (classifier.isHeaderOrFooter(block, pageHeight))
        flags += " [header/footer]";
      else if (classifier.isPotentialHeading(features))
        flags += " [heading]";
      if (features.isBold)
        flags += " bold";
      if (features.isCentered)
        flags += " centered";
      if (features.isTocEntry)
        flags += " toc";

      std::cout << std::setw(8) << std::setprecision(1) << block.top()
                << std::setw(8) << block.fontSize << "  "
                << std::setw(24) << std::left << block.fontName.substr(0, 23)
                << std::right << " \"" << block.text.substr(0, 60) << "\""
                << flags << std::endl;
    }
  }

  std::cout << std::endl << "[Outline]" << std::endl;
  std::cout << outline::dumpOutline(outliner.process(extraction.pages))
            << std::endl;

  return 0;
}
