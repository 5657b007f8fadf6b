#ifndef OUTLINE_BATCH_PROCESSOR_HPP
#define OUTLINE_BATCH_PROCESSOR_HPP

#include "DocumentOutliner.hpp"
#include "EventRecorder.hpp"
#include "OutlineConfig.hpp"
#include "PDFWordExtractor.hpp"

#include <string>

namespace outline {

/**
 * @brief Counts of a directory run
 */
struct BatchSummary {
  int found = 0;     ///< PDF files found in the input directory
  int succeeded = 0; ///< Files whose outline was written
  int failed = 0;    ///< Files that could not be processed
};

/**
 * @brief Turns PDF files into outline JSON files
 *
 * A failing file is reported and counted; it never stops a directory run.
 */
class BatchProcessor {
public:
  /**
   * @brief Constructor
   * @param config Pipeline settings
   * @param recorder Optional event sink, not owned
   */
  explicit BatchProcessor(const OutlineConfig &config = OutlineConfig(),
                          EventRecorder *recorder = nullptr);

  /**
   * @brief Extract and outline one PDF
   * @param pdfPath Input PDF
   * @param result Receives the outline on success
   * @return true if words could be extracted from at least one page
   */
  bool outlinePdf(const std::string &pdfPath, OutlineResult &result) const;

  /**
   * @brief Outline one PDF into a JSON file
   * @param pdfPath Input PDF
   * @param outputPath Destination JSON file
   * @return true if the JSON file was written
   */
  bool processFile(const std::string &pdfPath,
                   const std::string &outputPath) const;

  /**
   * @brief Outline every *.pdf of a directory into <stem>.json files
   * @param inputDir Directory scanned (not recursively) for PDF files
   * @param outputDir Created if missing
   * @return Number of files found, written and failed
   */
  BatchSummary processDirectory(const std::string &inputDir,
                                const std::string &outputDir) const;

private:
  void log(EventLevel level, const std::string &message) const;

  PDFWordExtractor m_extractor;
  DocumentOutliner m_outliner;
  EventRecorder *m_recorder;
};

} // namespace outline

#endif // OUTLINE_BATCH_PROCESSOR_HPP
