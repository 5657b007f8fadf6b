#ifndef OUTLINE_TEST_HELPERS_HPP
#define OUTLINE_TEST_HELPERS_HPP

#include "EventRecorder.hpp"
#include "OutlineTypes.hpp"

#include <string>
#include <utility>
#include <vector>

namespace outline {
namespace testing {

inline WordFragment makeWord(const std::string &text, double x0, double top,
                             double x1, double bottom,
                             const std::string &fontName, double fontSize,
                             int pageNumber = 1) {
  WordFragment word;
  word.text = text;
  word.boundingBox = cv::Rect2d(x0, top, x1 - x0, bottom - top);
  word.fontName = fontName;
  word.fontSize = fontSize;
  word.pageNumber = pageNumber;
  return word;
}

inline TextBlock makeBlock(const std::string &text, double x0, double top,
                           double x1, const std::string &fontName,
                           double fontSize, int pageNumber = 1) {
  TextBlock block;
  block.text = text;
  block.boundingBox = cv::Rect2d(x0, top, x1 - x0, fontSize);
  block.fontName = fontName;
  block.fontSize = fontSize;
  block.pageNumber = pageNumber;
  return block;
}

inline PageBlocks makePage(int pageNumber, std::vector<TextBlock> blocks) {
  PageBlocks page;
  page.pageNumber = pageNumber;
  page.blocks = std::move(blocks);
  return page;
}

/// Keeps every event for inspection
class CapturingRecorder : public EventRecorder {
public:
  void recordEvent(EventLevel level, const std::string &message) override {
    events.emplace_back(level, message);
  }

  bool contains(EventLevel level) const {
    for (const auto &event : events) {
      if (event.first == level)
        return true;
    }
    return false;
  }

  std::vector<std::pair<EventLevel, std::string>> events;
};

} // namespace testing
} // namespace outline

#endif // OUTLINE_TEST_HELPERS_HPP
