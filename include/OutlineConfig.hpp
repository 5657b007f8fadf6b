#ifndef OUTLINE_CONFIG_HPP
#define OUTLINE_CONFIG_HPP

#include <string>

namespace outline {

/**
 * @brief Clustering algorithm used to turn heading font sizes into levels
 */
enum class LevelAlgorithm {
  KMeans,    ///< OpenCV k-means seeded from a rank partition (default)
  LargestGap ///< Split sorted sizes at the largest jumps
};

/// Parse "kmeans" or "gap"; returns false for anything else
bool parseLevelAlgorithm(const std::string &name, LevelAlgorithm &algorithm);

/**
 * @brief Thresholds for grouping words into lines and blocks
 */
struct GroupingConfig {
  double lineTolerance = 2.0; ///< Max top difference for words on one line
  double blockGapFactor = 1.6; ///< Line gap, in font sizes, that ends a block
  double fontSizeTolerance = 1.0; ///< Size difference that ends a block
};

/**
 * @brief Thresholds for title extraction and heading detection
 *
 * The positional thresholds are tuned for A4/Letter sized pages.
 */
struct ClassifierConfig {
  double headerFooterRatio = 0.08; ///< Top/bottom page band ignored
  double titleMaxTop = 400.0;      ///< Title must start above this y
  int titleMaxWords = 25;          ///< Longer blocks cannot be the title
  double centerToleranceRatio = 0.15; ///< Centering tolerance, page widths
  double centeredBoost = 1.5;      ///< Title score factor for centered text
  double boldBoost = 1.2;          ///< Title score factor for bold text
  int headingMaxWords = 20;        ///< Longer blocks are never headings
  int headingSignalMaxWords = 15;  ///< Heading signals need fewer words
  double largeFontThreshold = 14.0;   ///< Size above which text is a heading
  double allCapsFontThreshold = 11.0; ///< Min size for all-caps headings
  int maxLevels = 3;               ///< Number of heading levels (H1..H3)
  LevelAlgorithm levelAlgorithm = LevelAlgorithm::KMeans;
};

/**
 * @brief Complete configuration for one outline run
 */
struct OutlineConfig {
  GroupingConfig grouping;
  ClassifierConfig classifier;
};

} // namespace outline

#endif // OUTLINE_CONFIG_HPP
