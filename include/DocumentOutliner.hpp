#ifndef OUTLINE_DOCUMENT_OUTLINER_HPP
#define OUTLINE_DOCUMENT_OUTLINER_HPP

#include "BlockGrouper.hpp"
#include "OutlineClassifier.hpp"
#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"

#include <vector>

namespace outline {

class EventRecorder;

/**
 * @brief Runs the whole outline pipeline on extracted pages
 *
 * Each instance owns its grouper and classifier and keeps no per-document
 * state, so separate instances can process documents in parallel.
 *
 * Example usage:
 * @code
 * outline::StreamEventRecorder log(std::cerr);
 * outline::DocumentOutliner outliner(outline::OutlineConfig(), &log);
 * outline::OutlineResult result = outliner.process(pages);
 * std::cout << outline::dumpOutline(result) << std::endl;
 * @endcode
 */
class DocumentOutliner {
public:
  /**
   * @brief Constructor
   * @param config Grouping and classification settings
   * @param recorder Optional event sink, not owned
   */
  explicit DocumentOutliner(const OutlineConfig &config = OutlineConfig(),
                            EventRecorder *recorder = nullptr);

  /**
   * @brief Group every page into blocks
   * @param pages Extracted words, one entry per page
   * @return Blocks with the page geometry carried over
   */
  std::vector<PageBlocks> groupPages(const std::vector<PageContent> &pages) const;

  /**
   * @brief Group and classify a document; never throws
   * @param pages Extracted words, one entry per page
   * @return Title and ordered headings
   */
  OutlineResult process(const std::vector<PageContent> &pages) const;

  const OutlineConfig &getConfig() const { return m_config; }

private:
  OutlineConfig m_config;
  BlockGrouper m_grouper;
  OutlineClassifier m_classifier;
  EventRecorder *m_recorder;
};

} // namespace outline

#endif // OUTLINE_DOCUMENT_OUTLINER_HPP
