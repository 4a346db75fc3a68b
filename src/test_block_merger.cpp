#include "BlockMerger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using a11y::BlockKind;
using a11y::RawBlock;
using a11y::Rect;
using a11y::TextBlock;

namespace {

// A text block holding one line with one span per label
RawBlock block(const Rect &bbox, std::vector<std::string> labels) {
  RawBlock b;
  b.kind = BlockKind::Text;
  b.hasBBox = true;
  b.bbox = bbox;
  for (const auto &label : labels) {
    a11y::TextLine line;
    a11y::TextSpan span;
    span.text = label;
    span.bbox = bbox;
    span.origin = a11y::Point{bbox.x0, bbox.y1};
    span.fontSize = 10;
    line.spans.push_back(span);
    b.lines.push_back(line);
  }
  return b;
}

std::vector<std::string> lineLabels(const TextBlock &b) {
  std::vector<std::string> labels;
  for (const auto &line : b.lines) {
    labels.push_back(line.spans.front().text);
  }
  return labels;
}

std::vector<std::string> allLabels(const std::vector<TextBlock> &blocks) {
  std::vector<std::string> labels;
  for (const auto &b : blocks) {
    auto l = lineLabels(b);
    labels.insert(labels.end(), l.begin(), l.end());
  }
  return labels;
}

} // namespace

TEST(BlockMergerTest, EmptyInputGivesEmptyOutput) {
  EXPECT_TRUE(a11y::mergeTextBlocks({}, 15).empty());
}

TEST(BlockMergerTest, SingleBlockIsUnchanged) {
  RawBlock only = block(Rect(50, 100, 300, 140), {"a", "b"});
  auto merged = a11y::mergeTextBlocks({only}, 15);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].bbox, only.bbox);
  EXPECT_EQ(lineLabels(merged[0]), (std::vector<std::string>{"a", "b"}));
}

TEST(BlockMergerTest, AdjacentAlignedBlocksMerge) {
  // Gap of 10, left edges 2 apart, threshold 15
  RawBlock top = block(Rect(50, 100, 300, 140), {"first"});
  RawBlock bottom = block(Rect(52, 150, 280, 190), {"second"});

  auto merged = a11y::mergeTextBlocks({bottom, top}, 15);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].bbox, Rect(50, 100, 300, 190));
  EXPECT_EQ(lineLabels(merged[0]),
            (std::vector<std::string>{"first", "second"}));
}

TEST(BlockMergerTest, GapAboveThresholdSplits) {
  RawBlock top = block(Rect(50, 100, 300, 140), {"first"});
  RawBlock bottom = block(Rect(50, 156, 300, 190), {"second"});

  auto merged = a11y::mergeTextBlocks({top, bottom}, 15);
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(merged[0].bbox, top.bbox);
  EXPECT_EQ(merged[1].bbox, bottom.bbox);
}

TEST(BlockMergerTest, GapEqualToThresholdMerges) {
  RawBlock top = block(Rect(50, 100, 300, 140), {"first"});
  RawBlock bottom = block(Rect(50, 155, 300, 190), {"second"});
  EXPECT_EQ(a11y::mergeTextBlocks({top, bottom}, 15).size(), 1u);
}

TEST(BlockMergerTest, MisalignedLeftEdgesSplit) {
  RawBlock top = block(Rect(50, 100, 300, 140), {"first"});
  RawBlock indented = block(Rect(55, 145, 300, 190), {"second"});
  EXPECT_EQ(a11y::mergeTextBlocks({top, indented}, 15).size(), 2u);
}

TEST(BlockMergerTest, OverlappingBlocksMerge) {
  RawBlock top = block(Rect(50, 100, 300, 140), {"first"});
  RawBlock overlapping = block(Rect(51, 130, 320, 160), {"second"});
  auto merged = a11y::mergeTextBlocks({top, overlapping}, 5);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].bbox, Rect(50, 100, 320, 160));
}

TEST(BlockMergerTest, ChainsIntoOneParagraph) {
  std::vector<RawBlock> blocks = {
      block(Rect(40, 200, 300, 220), {"3"}),
      block(Rect(40, 100, 300, 120), {"1"}),
      block(Rect(42, 150, 300, 170), {"2"}),
      block(Rect(41, 250, 300, 270), {"4"}),
  };
  auto merged = a11y::mergeTextBlocks(blocks, 30);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(lineLabels(merged[0]),
            (std::vector<std::string>{"1", "2", "3", "4"}));
}

TEST(BlockMergerTest, AccumulatorLeftEdgeIsUsedForAlignment) {
  // The second block widens the paragraph to the left; the third is compared
  // against the merged left edge (38), not the original one (40)
  std::vector<RawBlock> blocks = {
      block(Rect(40, 100, 300, 120), {"1"}),
      block(Rect(38, 125, 300, 145), {"2"}),
      block(Rect(43, 150, 300, 170), {"3"}),
  };
  auto merged = a11y::mergeTextBlocks(blocks, 10);
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(lineLabels(merged[0]), (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(lineLabels(merged[1]), (std::vector<std::string>{"3"}));
}

TEST(BlockMergerTest, IsDeterministicWithTies) {
  // Two blocks share the same top edge; document order breaks the tie
  std::vector<RawBlock> blocks = {
      block(Rect(300, 100, 500, 120), {"right"}),
      block(Rect(50, 100, 250, 120), {"left"}),
      block(Rect(50, 400, 250, 420), {"below"}),
  };
  auto first = a11y::mergeTextBlocks(blocks, 15);
  for (int i = 0; i < 5; i++) {
    auto again = a11y::mergeTextBlocks(blocks, 15);
    ASSERT_EQ(again.size(), first.size());
    for (size_t j = 0; j < first.size(); j++) {
      EXPECT_EQ(again[j].bbox, first[j].bbox);
      EXPECT_EQ(lineLabels(again[j]), lineLabels(first[j]));
    }
  }
  ASSERT_EQ(first.size(), 3u);
  EXPECT_EQ(lineLabels(first[0]), (std::vector<std::string>{"right"}));
  EXPECT_EQ(lineLabels(first[1]), (std::vector<std::string>{"left"}));
}

TEST(BlockMergerTest, NoLineIsDroppedOrDuplicated) {
  std::vector<RawBlock> blocks = {
      block(Rect(50, 500, 300, 540), {"e", "f"}),
      block(Rect(50, 100, 300, 140), {"a"}),
      block(Rect(200, 120, 400, 160), {"b", "c"}),
      block(Rect(52, 145, 300, 200), {"d"}),
      block(Rect(10, 700, 40, 720), {"g"}),
  };
  auto merged = a11y::mergeTextBlocks(blocks, 20);

  auto labels = allLabels(merged);
  std::sort(labels.begin(), labels.end());
  EXPECT_EQ(labels,
            (std::vector<std::string>{"a", "b", "c", "d", "e", "f", "g"}));
}

TEST(BlockMergerTest, DoesNotModifyInput) {
  std::vector<RawBlock> blocks = {
      block(Rect(50, 100, 300, 140), {"first"}),
      block(Rect(50, 145, 300, 190), {"second"}),
  };
  auto merged = a11y::mergeTextBlocks(blocks, 15);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(blocks[0].bbox, Rect(50, 100, 300, 140));
  EXPECT_EQ(blocks[0].lines.size(), 1u);
}

TEST(BlockMergerTest, IgnoresImageAndMalformedBlocks) {
  RawBlock text = block(Rect(50, 100, 300, 140), {"text"});
  RawBlock image;
  image.kind = BlockKind::Image;
  image.hasBBox = true;
  image.bbox = Rect(50, 145, 300, 300);
  RawBlock noBox = block(Rect(), {"lost"});
  noBox.hasBBox = false;

  auto merged = a11y::mergeTextBlocks({text, image, noBox}, 15);
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].bbox, text.bbox);
}
