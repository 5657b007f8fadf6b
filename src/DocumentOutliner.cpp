#include "DocumentOutliner.hpp"

#include "EventRecorder.hpp"

#include <exception>

namespace outline {

DocumentOutliner::DocumentOutliner(const OutlineConfig &config,
                                   EventRecorder *recorder)
    : m_config(config), m_grouper(config.grouping, recorder),
      m_classifier(config.classifier, recorder), m_recorder(recorder) {}

std::vector<PageBlocks>
DocumentOutliner::groupPages(const std::vector<PageContent> &pages) const {
  std::vector<PageBlocks> grouped;
  grouped.reserve(pages.size());

  for (const auto &page : pages) {
    PageBlocks blocks;
    blocks.pageNumber = page.pageNumber;
    blocks.width = page.width;
    blocks.height = page.height;
    blocks.blocks = m_grouper.group(page.words, page.pageNumber);
    grouped.push_back(std::move(blocks));
  }
  return grouped;
}

OutlineResult
DocumentOutliner::process(const std::vector<PageContent> &pages) const {
  try {
    return m_classifier.build(groupPages(pages));
  } catch (const std::exception &e) {
    if (m_recorder) {
      m_recorder->recordEvent(EventLevel::Error,
                              std::string("Outline pipeline failed: ") +
                                  e.what());
    }
    OutlineResult result;
    result.title = pages.empty() ? kNoContentFound : kUntitledDocument;
    return result;
  }
}

} // namespace outline
