#ifndef OUTLINE_CLASSIFIER_HPP
#define OUTLINE_CLASSIFIER_HPP

#include "EventRecorder.hpp"
#include "LevelAssigner.hpp"
#include "OutlineConfig.hpp"
#include "OutlineTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace outline {

/**
 * @brief Builds the title and leveled heading outline from text blocks
 *
 * The pipeline is:
 * - drop blocks in the header/footer bands of the page
 * - pick the title among the blocks near the top of page 1
 * - keep blocks showing a heading signal (size, numbering, bold, caps)
 * - cluster heading font sizes into at most three levels
 * - order headings by page, then by vertical position
 *
 * The geometry of the first page is used as the reference for all pages.
 */
class OutlineClassifier {
public:
  /**
   * @brief Constructor
   * @param config Classification thresholds and level algorithm
   * @param recorder Optional event sink, not owned
   */
  explicit OutlineClassifier(const ClassifierConfig &config = ClassifierConfig(),
                             EventRecorder *recorder = nullptr);

  /**
   * @brief Constructor with a custom level assigner
   * @param config Classification thresholds
   * @param assigner Clustering used for level assignment
   * @param recorder Optional event sink, not owned
   */
  OutlineClassifier(const ClassifierConfig &config,
                    std::unique_ptr<LevelAssigner> assigner,
                    EventRecorder *recorder = nullptr);

  ~OutlineClassifier();

  OutlineClassifier(const OutlineClassifier &) = delete;
  OutlineClassifier &operator=(const OutlineClassifier &) = delete;
  OutlineClassifier(OutlineClassifier &&other) noexcept;
  OutlineClassifier &operator=(OutlineClassifier &&other) noexcept;

  /**
   * @brief Build the outline of a document
   *
   * Never throws. No pages yields the "No Content Found" result; a failure
   * inside the pipeline is recorded and yields an "Untitled Document" result
   * with an empty outline.
   *
   * @param pages Grouped blocks of every page, in page order
   * @return Title and ordered headings
   */
  OutlineResult build(const std::vector<PageBlocks> &pages) const;

  /**
   * @brief Whether a block starts inside the header or footer band
   * @param block Block to test
   * @param pageHeight Reference page height
   */
  bool isHeaderOrFooter(const TextBlock &block, double pageHeight) const;

  /**
   * @brief Compute the classification features of a block
   * @param block Block to describe
   * @param pageWidth Reference page width, used for centering
   */
  HeadingFeatures extractFeatures(const TextBlock &block,
                                  double pageWidth) const;

  /**
   * @brief Whether the features describe a heading
   */
  bool isPotentialHeading(const HeadingFeatures &features) const;

  /**
   * @brief Pick the document title among the page 1 blocks
   * @param blocks Content blocks (header/footer already removed)
   * @param pageWidth Reference page width
   * @return Title text, or "Untitled Document"
   */
  std::string extractTitle(const std::vector<TextBlock> &blocks,
                           double pageWidth) const;

  /// Text ends with a dot leader of 4+ dots and a page number; linear time
  static bool isTocEntry(const std::string &text);

  /// Text begins with an outline number such as "1.", "2.1" or "3.2.1"
  static bool startsWithOutlineNumber(const std::string &text);

  const ClassifierConfig &getConfig() const { return m_config; }

private:
  struct Candidate {
    HeadingFeatures features;
    const TextBlock *block;
  };

  /// Heading entry that still carries its vertical sort key
  struct LeveledEntry {
    HeadingLevel level;
    std::string text;
    int page;
    double top;
  };

  std::vector<LeveledEntry>
  assignLevels(const std::vector<Candidate> &candidates) const;

  OutlineResult buildOutline(const std::vector<PageBlocks> &pages) const;

  void record(EventLevel level, const std::string &message) const;

  ClassifierConfig m_config;
  std::unique_ptr<LevelAssigner> m_assigner;
  EventRecorder *m_recorder;
};

} // namespace outline

#endif // OUTLINE_CLASSIFIER_HPP
