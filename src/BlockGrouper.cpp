#include "BlockGrouper.hpp"

#include "EventRecorder.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>

namespace outline {

namespace {

double roundToHundredths(double value) {
  return std::round(value * 100.0) / 100.0;
}

void sortLeftToRight(std::vector<WordFragment> &words) {
  std::stable_sort(words.begin(), words.end(),
                   [](const WordFragment &a, const WordFragment &b) {
                     return a.x0() < b.x0();
                   });
}

} // anonymous namespace

BlockGrouper::BlockGrouper(const GroupingConfig &config,
                           EventRecorder *recorder)
    : m_config(config), m_recorder(recorder) {}

std::vector<TextBlock>
BlockGrouper::group(const std::vector<WordFragment> &words,
                    int pageNumber) const {
  if (words.empty())
    return {};

  try {
    std::vector<TextLine> lines = assembleLines(words);
    std::vector<TextBlock> blocks = assembleBlocks(lines, pageNumber);

    if (m_recorder) {
      std::ostringstream msg;
      msg << "Page " << pageNumber << ": grouped " << words.size()
          << " words into " << lines.size() << " lines and " << blocks.size()
          << " blocks";
      m_recorder->recordEvent(EventLevel::Debug, msg.str());
    }
    return blocks;
  } catch (const std::exception &e) {
    if (m_recorder) {
      m_recorder->recordEvent(EventLevel::Error,
                              "Block grouping failed on page " +
                                  std::to_string(pageNumber) + ": " +
                                  e.what());
    }
    return {};
  }
}

std::vector<TextLine>
BlockGrouper::assembleLines(const std::vector<WordFragment> &words) const {
  std::vector<TextLine> lines;
  if (words.empty())
    return lines;

  // Reading order: top to bottom, then left to right
  std::vector<WordFragment> sorted(words);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const WordFragment &a, const WordFragment &b) {
                     if (a.top() != b.top())
                       return a.top() < b.top();
                     return a.x0() < b.x0();
                   });

  TextLine current;
  for (auto &word : sorted) {
    if (!current.words.empty() &&
        std::abs(word.top() - current.words.front().top()) >=
            m_config.lineTolerance) {
      sortLeftToRight(current.words);
      lines.push_back(std::move(current));
      current = TextLine();
    }
    current.words.push_back(std::move(word));
  }
  sortLeftToRight(current.words);
  lines.push_back(std::move(current));

  return lines;
}

bool BlockGrouper::startsNewBlock(const TextLine &previous,
                                  const TextLine &line) const {
  const WordFragment &prevFirst = previous.words.front();
  const WordFragment &first = line.words.front();

  double verticalGap = first.top() - prevFirst.top();
  bool largeGap = verticalGap > prevFirst.fontSize * m_config.blockGapFactor;
  bool fontNameChanged = first.fontName != prevFirst.fontName;
  bool fontSizeChanged = std::abs(first.fontSize - prevFirst.fontSize) >=
                         m_config.fontSizeTolerance;

  return largeGap || fontNameChanged || fontSizeChanged;
}

std::vector<TextBlock>
BlockGrouper::assembleBlocks(const std::vector<TextLine> &lines,
                             int pageNumber) const {
  std::vector<TextBlock> blocks;
  std::vector<const TextLine *> current;

  for (const auto &line : lines) {
    if (line.words.empty())
      continue;

    if (!current.empty() && startsNewBlock(*current.back(), line)) {
      blocks.push_back(makeBlock(current, pageNumber));
      current.clear();
    }
    current.push_back(&line);
  }

  // The last block is never closed by a following line
  if (!current.empty())
    blocks.push_back(makeBlock(current, pageNumber));

  return blocks;
}

TextBlock BlockGrouper::makeBlock(const std::vector<const TextLine *> &lines,
                                  int pageNumber) {
  TextBlock block;
  block.pageNumber = pageNumber;

  const WordFragment &firstWord = lines.front()->words.front();
  block.fontName = firstWord.fontName;
  block.fontSize = roundToHundredths(firstWord.fontSize);

  double minX = firstWord.x0();
  double minY = firstWord.top();
  double maxX = firstWord.x1();
  double maxY = firstWord.bottom();

  for (const TextLine *line : lines) {
    if (!block.text.empty())
      block.text += ' ';
    block.text += line->text();

    for (const auto &word : line->words) {
      minX = std::min(minX, word.x0());
      minY = std::min(minY, word.top());
      maxX = std::max(maxX, word.x1());
      maxY = std::max(maxY, word.bottom());
    }
  }

  block.boundingBox = cv::Rect2d(minX, minY, maxX - minX, maxY - minY);
  return block;
}

} // namespace outline
