#include "OutlineClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <numeric>
#include <sstream>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace outline {

namespace {

std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    end--;
  return s.substr(start, end - start);
}

int countWords(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  int count = 0;
  while (stream >> word)
    count++;
  return count;
}

// Requires at least one cased letter and no lowercase or titlecase letter.
// Malformed UTF-8 sequences are skipped.
bool isAllUpper(const std::string &text) {
  const char *s = text.data();
  int32_t length = static_cast<int32_t>(text.size());
  int32_t i = 0;
  bool hasCased = false;
  while (i < length) {
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c < 0)
      continue;
    if (u_islower(c) || u_istitle(c))
      return false;
    if (u_isupper(c))
      hasCased = true;
  }
  return hasCased;
}

bool isAsciiDigit(char c) { return c >= '0' && c <= '9'; }

bool isAsciiSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isAllDigits(const std::string &text) {
  if (text.empty())
    return false;
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

bool fontLooksBold(const std::string &fontName) {
  std::string lower = fontName;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower.find("bold") != std::string::npos ||
         lower.find("black") != std::string::npos;
}

std::string cleanTitle(const std::string &title) {
  std::string cleaned = title;
  std::replace(cleaned.begin(), cleaned.end(), '\n', ' ');
  return trim(cleaned);
}

} // anonymous namespace

OutlineClassifier::OutlineClassifier(const ClassifierConfig &config,
                                     EventRecorder *recorder)
    : m_config(config), m_assigner(createLevelAssigner(config.levelAlgorithm)),
      m_recorder(recorder) {}

OutlineClassifier::OutlineClassifier(const ClassifierConfig &config,
                                     std::unique_ptr<LevelAssigner> assigner,
                                     EventRecorder *recorder)
    : m_config(config), m_assigner(std::move(assigner)), m_recorder(recorder) {
  if (!m_assigner) {
    m_assigner = createLevelAssigner(config.levelAlgorithm);
  }
}

OutlineClassifier::~OutlineClassifier() = default;

OutlineClassifier::OutlineClassifier(OutlineClassifier &&other) noexcept =
    default;

OutlineClassifier &
OutlineClassifier::operator=(OutlineClassifier &&other) noexcept = default;

void OutlineClassifier::record(EventLevel level,
                               const std::string &message) const {
  if (m_recorder) {
    m_recorder->recordEvent(level, message);
  }
}

bool OutlineClassifier::isTocEntry(const std::string &text) {
  // Matches a "....  12" leader at the end, scanning backwards
  size_t i = text.size();
  while (i > 0 && isAsciiSpace(text[i - 1]))
    i--;
  size_t digitsEnd = i;
  while (i > 0 && isAsciiDigit(text[i - 1]))
    i--;
  if (i == digitsEnd)
    return false;
  while (i > 0 && isAsciiSpace(text[i - 1]))
    i--;
  size_t dots = 0;
  while (i > 0 && text[i - 1] == '.') {
    i--;
    if (++dots >= 4)
      return true;
  }
  return false;
}

bool OutlineClassifier::startsWithOutlineNumber(const std::string &text) {
  // "1 ", "1. ", "2.1 ", "3.2.1. "
  size_t i = 0;
  const size_t n = text.size();
  if (i == n || !isAsciiDigit(text[i]))
    return false;
  while (i < n && isAsciiDigit(text[i]))
    i++;
  while (i + 1 < n && text[i] == '.' && isAsciiDigit(text[i + 1])) {
    i++;
    while (i < n && isAsciiDigit(text[i]))
      i++;
  }
  if (i < n && text[i] == '.')
    i++;
  return i < n && isAsciiSpace(text[i]);
}

bool OutlineClassifier::isHeaderOrFooter(const TextBlock &block,
                                         double pageHeight) const {
  double y = block.top();
  return y < pageHeight * m_config.headerFooterRatio ||
         y > pageHeight * (1.0 - m_config.headerFooterRatio);
}

HeadingFeatures OutlineClassifier::extractFeatures(const TextBlock &block,
                                                   double pageWidth) const {
  HeadingFeatures features;
  features.text = trim(block.text);
  features.fontSize = block.fontSize;
  features.wordCount = countWords(features.text);
  features.isBold = fontLooksBold(block.fontName);
  features.isAllCaps = features.wordCount > 0 && isAllUpper(features.text);
  features.startsWithNumber = startsWithOutlineNumber(features.text);

  double x0 = block.boundingBox.x;
  double x1 = block.boundingBox.x + block.boundingBox.width;
  double center = (x0 + x1) / 2.0;
  features.isCentered = std::abs(center - pageWidth / 2.0) <
                        pageWidth * m_config.centerToleranceRatio;

  features.isTocEntry = isTocEntry(features.text);
  return features;
}

bool OutlineClassifier::isPotentialHeading(
    const HeadingFeatures &features) const {
  // Disqualifiers
  if (features.text.empty() || features.wordCount > m_config.headingMaxWords ||
      features.isTocEntry || isAllDigits(features.text)) {
    return false;
  }

  bool shortEnough = features.wordCount < m_config.headingSignalMaxWords;
  if (!shortEnough)
    return false;

  if (features.fontSize > m_config.largeFontThreshold)
    return true;
  if (features.startsWithNumber)
    return true;
  if (features.isBold)
    return true;
  if (features.isAllCaps && features.fontSize > m_config.allCapsFontThreshold)
    return true;

  return false;
}

std::string OutlineClassifier::extractTitle(const std::vector<TextBlock> &blocks,
                                            double pageWidth) const {
  bool found = false;
  double bestScore = 0.0;
  std::string bestText;

  for (const auto &block : blocks) {
    if (block.pageNumber != 1)
      continue;
    if (block.top() > m_config.titleMaxTop)
      continue;

    HeadingFeatures features = extractFeatures(block, pageWidth);
    if (features.text.empty() || features.wordCount > m_config.titleMaxWords)
      continue;

    double score = features.fontSize;
    if (features.isCentered)
      score *= m_config.centeredBoost;
    if (features.isBold)
      score *= m_config.boldBoost;

    // Strictly greater: the first block wins ties
    if (!found || score > bestScore) {
      found = true;
      bestScore = score;
      bestText = features.text;
    }
  }

  return found ? bestText : std::string(kUntitledDocument);
}

std::vector<OutlineClassifier::LeveledEntry>
OutlineClassifier::assignLevels(const std::vector<Candidate> &candidates) const {
  std::vector<LeveledEntry> entries;
  if (candidates.empty())
    return entries;

  auto makeEntry = [](const Candidate &candidate, HeadingLevel level) {
    return LeveledEntry{level, candidate.features.text,
                        candidate.block->pageNumber, candidate.block->top()};
  };

  if (candidates.size() == 1) {
    entries.push_back(makeEntry(candidates.front(), HeadingLevel::H1));
    return entries;
  }

  std::vector<double> sizes;
  sizes.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    sizes.push_back(candidate.features.fontSize);
  }

  int maxLevels = std::max(1, std::min(m_config.maxLevels, 3));
  int k = std::min(countDistinct(sizes), maxLevels);

  ClusterAssignment clusters = m_assigner->assign(sizes, k);
  if (clusters.labels.size() != sizes.size() ||
      static_cast<int>(clusters.centers.size()) != k) {
    record(EventLevel::Warning,
           "Level assigner returned an inconsistent clustering, falling back "
           "to gap binning");
    clusters = GapLevelAssigner().assign(sizes, k);
  }

  // Largest center first: H1, then H2, then H3
  std::vector<int> order(static_cast<size_t>(k));
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&clusters](int a, int b) {
    return clusters.centers[static_cast<size_t>(a)] >
           clusters.centers[static_cast<size_t>(b)];
  });
  std::vector<int> rankOfCluster(static_cast<size_t>(k), k - 1);
  for (int rank = 0; rank < k; ++rank) {
    rankOfCluster[static_cast<size_t>(order[static_cast<size_t>(rank)])] = rank;
  }

  entries.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    int label = clusters.labels[i];
    int rank = (label >= 0 && label < k)
                   ? rankOfCluster[static_cast<size_t>(label)]
                   : k - 1;
    entries.push_back(makeEntry(candidates[i], levelFromRank(rank)));
  }

  std::ostringstream msg;
  msg << "Clustered " << candidates.size() << " headings into " << k
      << " level(s)";
  record(EventLevel::Debug, msg.str());
  return entries;
}

OutlineResult
OutlineClassifier::buildOutline(const std::vector<PageBlocks> &pages) const {
  const PageBlocks &reference = pages.front();
  double pageWidth = reference.width > 0 ? reference.width : kDefaultPageWidth;
  double pageHeight =
      reference.height > 0 ? reference.height : kDefaultPageHeight;

  // Filter out headers and footers
  std::vector<TextBlock> contentBlocks;
  size_t totalBlocks = 0;
  for (const auto &page : pages) {
    totalBlocks += page.blocks.size();
    for (const auto &block : page.blocks) {
      if (!isHeaderOrFooter(block, pageHeight))
        contentBlocks.push_back(block);
    }
  }

  std::ostringstream msg;
  msg << "Kept " << contentBlocks.size() << " of " << totalBlocks
      << " blocks after header/footer filtering";
  record(EventLevel::Debug, msg.str());

  std::string title = extractTitle(contentBlocks, pageWidth);
  std::string cleanedTitle = cleanTitle(title);
  record(EventLevel::Debug, "Title: \"" + cleanedTitle + "\"");

  std::vector<Candidate> candidates;
  for (const auto &block : contentBlocks) {
    HeadingFeatures features = extractFeatures(block, pageWidth);
    if (!isPotentialHeading(features))
      continue;
    // The title is never repeated as a heading
    if (features.text == title || features.text == cleanedTitle)
      continue;
    candidates.push_back(Candidate{features, &block});
  }

  record(EventLevel::Debug,
         "Found " + std::to_string(candidates.size()) + " heading candidates");

  std::vector<LeveledEntry> leveled = assignLevels(candidates);
  std::stable_sort(leveled.begin(), leveled.end(),
                   [](const LeveledEntry &a, const LeveledEntry &b) {
                     if (a.page != b.page)
                       return a.page < b.page;
                     return a.top < b.top;
                   });

  OutlineResult result;
  result.title = cleanedTitle;
  result.outline.reserve(leveled.size());
  for (auto &entry : leveled) {
    result.outline.push_back(
        OutlineEntry{entry.level, std::move(entry.text), entry.page});
  }
  return result;
}

OutlineResult
OutlineClassifier::build(const std::vector<PageBlocks> &pages) const {
  if (pages.empty()) {
    record(EventLevel::Info, "No pages to analyse");
    OutlineResult result;
    result.title = kNoContentFound;
    return result;
  }

  try {
    return buildOutline(pages);
  } catch (const std::exception &e) {
    record(EventLevel::Error,
           std::string("Outline classification failed: ") + e.what());
    OutlineResult result;
    result.title = kUntitledDocument;
    return result;
  }
}

} // namespace outline
