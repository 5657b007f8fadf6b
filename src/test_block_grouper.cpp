#include <catch2/catch.hpp>

#include "BlockGrouper.hpp"
#include "test_helpers.hpp"

using outline::BlockGrouper;
using outline::TextBlock;
using outline::WordFragment;
using outline::testing::CapturingRecorder;
using outline::testing::makeWord;

TEST_CASE("group returns no blocks for an empty page", "[grouper]") {
  BlockGrouper grouper;
  REQUIRE(grouper.group({}, 1).empty());
  REQUIRE(grouper.assembleLines({}).empty());
}

TEST_CASE("words on one line merge into a heading block", "[grouper]") {
  std::vector<WordFragment> words = {
      makeWord("Chapter", 72, 100, 130, 116, "Bold", 16),
      makeWord("One", 136, 100.5, 170, 116.5, "Bold", 16),
      makeWord("Body", 72, 140, 100, 150, "Regular", 10),
      makeWord("text", 104, 140, 125, 150, "Regular", 10),
  };

  BlockGrouper grouper;
  std::vector<TextBlock> blocks = grouper.group(words, 1);

  REQUIRE(blocks.size() == 2);
  CHECK(blocks[0].text == "Chapter One");
  CHECK(blocks[0].fontName == "Bold");
  CHECK(blocks[0].fontSize == Approx(16.0));
  CHECK(blocks[0].boundingBox.x == Approx(72.0));
  CHECK(blocks[0].boundingBox.y == Approx(100.0));
  CHECK(blocks[0].boundingBox.x + blocks[0].boundingBox.width ==
        Approx(170.0));
  CHECK(blocks[0].boundingBox.y + blocks[0].boundingBox.height ==
        Approx(116.5));

  CHECK(blocks[1].text == "Body text");
  CHECK(blocks[1].fontName == "Regular");
}

TEST_CASE("lines are re-sorted left to right", "[grouper]") {
  // "World" sits slightly higher, so it is sorted first
  std::vector<WordFragment> words = {
      makeWord("World", 200, 50, 250, 60, "Regular", 10),
      makeWord("Hello", 100, 51, 150, 61, "Regular", 10),
  };

  BlockGrouper grouper;
  auto lines = grouper.assembleLines(words);

  REQUIRE(lines.size() == 1);
  CHECK(lines[0].text() == "Hello World");
}

TEST_CASE("line membership is measured from the first word of the line",
          "[grouper]") {
  std::vector<WordFragment> words = {
      makeWord("a", 10, 100, 20, 110, "Regular", 10),
      makeWord("b", 30, 101.5, 40, 111.5, "Regular", 10),
      makeWord("c", 50, 103, 60, 113, "Regular", 10),
  };

  BlockGrouper grouper;
  auto lines = grouper.assembleLines(words);

  REQUIRE(lines.size() == 2);
  CHECK(lines[0].text() == "a b");
  CHECK(lines[1].text() == "c");
}

TEST_CASE("a top difference of exactly the tolerance starts a new line",
          "[grouper]") {
  std::vector<WordFragment> words = {
      makeWord("first", 10, 100, 40, 110, "Regular", 10),
      makeWord("second", 50, 102, 90, 112, "Regular", 10),
  };

  BlockGrouper grouper;
  REQUIRE(grouper.assembleLines(words).size() == 2);
}

TEST_CASE("consecutive body lines form one paragraph block", "[grouper]") {
  std::vector<WordFragment> words = {
      makeWord("line", 72, 200, 100, 210, "Regular", 10),
      makeWord("one", 104, 200, 125, 210, "Regular", 10),
      makeWord("line", 72, 212, 100, 222, "Regular", 10),
      makeWord("two", 104, 212, 125, 222, "Regular", 10),
      makeWord("line", 72, 224, 100, 234, "Regular", 10),
      makeWord("three", 104, 224, 140, 234, "Regular", 10),
      // 40 units below: larger than 1.6 x 10
      makeWord("next", 72, 264, 100, 274, "Regular", 10),
  };

  BlockGrouper grouper;
  auto blocks = grouper.group(words, 3);

  REQUIRE(blocks.size() == 2);
  CHECK(blocks[0].text == "line one line two line three");
  CHECK(blocks[0].boundingBox.x + blocks[0].boundingBox.width ==
        Approx(140.0));
  CHECK(blocks[0].boundingBox.y + blocks[0].boundingBox.height ==
        Approx(234.0));
  CHECK(blocks[1].text == "next");
  for (const auto &block : blocks) {
    CHECK(block.pageNumber == 3);
  }
}

TEST_CASE("font changes split blocks", "[grouper]") {
  SECTION("font name") {
    std::vector<WordFragment> words = {
        makeWord("regular", 72, 100, 120, 110, "Regular", 10),
        makeWord("italic", 72, 112, 120, 122, "Italic", 10),
    };
    CHECK(BlockGrouper().group(words, 1).size() == 2);
  }

  SECTION("font size by one point or more") {
    std::vector<WordFragment> words = {
        makeWord("ten", 72, 100, 120, 110, "Regular", 10),
        makeWord("eleven", 72, 112, 120, 123, "Regular", 11),
    };
    CHECK(BlockGrouper().group(words, 1).size() == 2);
  }

  SECTION("font size within tolerance") {
    std::vector<WordFragment> words = {
        makeWord("ten", 72, 100, 120, 110, "Regular", 10),
        makeWord("tenhalf", 72, 112, 120, 122.5, "Regular", 10.5),
    };
    auto blocks = BlockGrouper().group(words, 1);
    REQUIRE(blocks.size() == 1);
    CHECK(blocks[0].text == "ten tenhalf");
  }
}

TEST_CASE("block font comes from the first word, rounded", "[grouper]") {
  std::vector<WordFragment> words = {
      makeWord("first", 72, 100, 120, 112, "Serif", 12.004),
      makeWord("second", 72, 113, 120, 125, "Serif", 12.6),
  };

  auto blocks = BlockGrouper().group(words, 1);

  REQUIRE(blocks.size() == 1);
  CHECK(blocks[0].fontSize == Approx(12.0));
  CHECK(blocks[0].fontName == "Serif");

  auto single = BlockGrouper().group(
      {makeWord("x", 0, 0, 5, 11, "Serif", 11.456)}, 1);
  REQUIRE(single.size() == 1);
  CHECK(single[0].fontSize == Approx(11.46));
}

TEST_CASE("configured tolerances are honoured", "[grouper]") {
  outline::GroupingConfig config;
  config.lineTolerance = 5.0;
  config.blockGapFactor = 5.0;

  std::vector<WordFragment> words = {
      makeWord("a", 10, 100, 20, 110, "Regular", 10),
      makeWord("b", 30, 104, 40, 114, "Regular", 10),
      makeWord("c", 10, 140, 20, 150, "Regular", 10),
  };

  BlockGrouper grouper(config);
  CHECK(grouper.assembleLines(words).size() == 2);
  auto blocks = grouper.group(words, 1);
  REQUIRE(blocks.size() == 1);
  CHECK(blocks[0].text == "a b c");
}

TEST_CASE("grouping reports progress to the recorder", "[grouper]") {
  CapturingRecorder recorder;
  BlockGrouper grouper(outline::GroupingConfig(), &recorder);

  grouper.group({makeWord("word", 0, 0, 10, 10, "Regular", 10)}, 2);

  REQUIRE_FALSE(recorder.events.empty());
  CHECK(recorder.events.front().first == outline::EventLevel::Debug);
  CHECK(recorder.events.front().second.find("Page 2") != std::string::npos);
}
