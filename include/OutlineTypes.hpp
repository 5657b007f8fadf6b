#ifndef OUTLINE_TYPES_HPP
#define OUTLINE_TYPES_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace outline {

/**
 * @brief A single word extracted from a page, with its position and font
 *
 * Coordinates use a top-left origin with y increasing downward, so
 * boundingBox.y is the top edge of the word.
 */
struct WordFragment {
  std::string text;       ///< Word text (UTF-8, non-empty)
  cv::Rect2d boundingBox; ///< x = x0, y = top, width = x1 - x0
  std::string fontName;   ///< Font name as reported by the extractor
  double fontSize = 0.0;  ///< Font size in points
  int pageNumber = 1;     ///< 1-indexed page number

  double x0() const { return boundingBox.x; }
  double top() const { return boundingBox.y; }
  double x1() const { return boundingBox.x + boundingBox.width; }
  double bottom() const { return boundingBox.y + boundingBox.height; }
};

/**
 * @brief Words sharing a baseline, ordered left to right
 */
struct TextLine {
  std::vector<WordFragment> words;

  /// Words joined by single spaces
  std::string text() const;
};

/**
 * @brief Contiguous lines merged into one semantic unit
 *
 * Font name and size come from the first word of the block, not from an
 * aggregate over its words.
 */
struct TextBlock {
  std::string text;       ///< Line texts joined by single spaces
  cv::Rect2d boundingBox; ///< Union of every constituent word box
  std::string fontName;   ///< Font of the first word
  double fontSize = 0.0;  ///< Size of the first word, rounded to 2 decimals
  int pageNumber = 1;     ///< 1-indexed page number

  double top() const { return boundingBox.y; }
};

/// Default page geometry (A4 in points) when the extractor reports none
constexpr double kDefaultPageWidth = 595.0;
constexpr double kDefaultPageHeight = 842.0;

/**
 * @brief Raw words of one page, as produced by the extraction layer
 */
struct PageContent {
  int pageNumber = 1;
  double width = kDefaultPageWidth;
  double height = kDefaultPageHeight;
  std::vector<WordFragment> words;
};

/**
 * @brief Grouped blocks of one page, the input of the classifier
 */
struct PageBlocks {
  int pageNumber = 1;
  double width = kDefaultPageWidth;
  double height = kDefaultPageHeight;
  std::vector<TextBlock> blocks;
};

/**
 * @brief Heading depth, H1 being the most prominent
 */
enum class HeadingLevel { H1, H2, H3 };

/// "H1", "H2" or "H3"
std::string toString(HeadingLevel level);

/// Level for a 0-based rank (0 -> H1); ranks past H3 clamp to H3
HeadingLevel levelFromRank(int rank);

/**
 * @brief Typographic and textual signals of a block used for classification
 */
struct HeadingFeatures {
  std::string text;        ///< Trimmed block text
  double fontSize = 0.0;   ///< Block font size
  bool isBold = false;     ///< Font name contains "bold" or "black"
  bool isAllCaps = false;  ///< Has cased letters and none are lowercase
  bool startsWithNumber = false; ///< Outline prefix such as "1." or "2.3.1"
  bool isCentered = false; ///< Block center close to page center
  int wordCount = 0;       ///< Whitespace-separated word count
  bool isTocEntry = false; ///< Looks like "Introduction ....... 5"
};

/**
 * @brief One heading in the final outline
 */
struct OutlineEntry {
  HeadingLevel level = HeadingLevel::H1;
  std::string text;
  int page = 1;
};

/**
 * @brief Document title and ordered headings
 */
struct OutlineResult {
  std::string title;
  std::vector<OutlineEntry> outline;
};

/// Title used when no title candidate exists
extern const char *const kUntitledDocument;
/// Title used when the document has no pages at all
extern const char *const kNoContentFound;

} // namespace outline

#endif // OUTLINE_TYPES_HPP
