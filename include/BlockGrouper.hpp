#ifndef OUTLINE_BLOCK_GROUPER_HPP
#define OUTLINE_BLOCK_GROUPER_HPP

#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"

#include <vector>

namespace outline {

class EventRecorder;

/**
 * @brief Groups the words of a page into lines, then into text blocks
 *
 * Lines are formed from words whose top coordinates lie within
 * GroupingConfig::lineTolerance of the first word of the line. Consecutive
 * lines are merged into a block while they share font name and size and the
 * gap between their tops stays below blockGapFactor font sizes.
 *
 * Example usage:
 * @code
 * outline::BlockGrouper grouper;
 * std::vector<outline::TextBlock> blocks =
 *     grouper.group(page.words, page.pageNumber);
 * @endcode
 */
class BlockGrouper {
public:
  /**
   * @brief Constructor
   * @param config Grouping thresholds
   * @param recorder Optional event sink, not owned
   */
  explicit BlockGrouper(const GroupingConfig &config = GroupingConfig(),
                        EventRecorder *recorder = nullptr);

  /**
   * @brief Group the words of one page into text blocks
   *
   * Never throws; an internal failure is recorded and yields no blocks.
   *
   * @param words Words of the page in any order
   * @param pageNumber 1-indexed page number stamped on every block
   * @return Blocks in top-to-bottom order
   */
  std::vector<TextBlock> group(const std::vector<WordFragment> &words,
                               int pageNumber) const;

  /**
   * @brief Assemble words into lines, each sorted left to right
   * @param words Words of the page in any order
   * @return Lines in top-to-bottom order
   */
  std::vector<TextLine>
  assembleLines(const std::vector<WordFragment> &words) const;

  /**
   * @brief Merge consecutive lines into blocks
   * @param lines Lines as produced by assembleLines()
   * @param pageNumber Page number stamped on every block
   * @return Blocks in line order
   */
  std::vector<TextBlock> assembleBlocks(const std::vector<TextLine> &lines,
                                        int pageNumber) const;

  const GroupingConfig &getConfig() const { return m_config; }

private:
  bool startsNewBlock(const TextLine &previous, const TextLine &line) const;
  static TextBlock makeBlock(const std::vector<const TextLine *> &lines,
                             int pageNumber);

  GroupingConfig m_config;
  EventRecorder *m_recorder;
};

} // namespace outline

#endif // OUTLINE_BLOCK_GROUPER_HPP
