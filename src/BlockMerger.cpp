#include "BlockMerger.hpp"

#include <algorithm>
#include <cmath>

namespace a11y {

namespace {

TextBlock toTextBlock(const RawBlock &raw) {
  TextBlock block;
  block.bbox = raw.bbox;
  block.lines = raw.lines;
  return block;
}

bool continuesParagraph(const TextBlock &current, const RawBlock &next,
                        double verticalThreshold) {
  double verticalGap = next.bbox.y0 - current.bbox.y1;
  return verticalGap <= verticalThreshold &&
         std::abs(next.bbox.x0 - current.bbox.x0) < kMergeLeftEdgeTolerance;
}

// Returns a new block; neither argument is modified
TextBlock appendBlock(const TextBlock &current, const RawBlock &next) {
  TextBlock merged;
  merged.bbox = unite(current.bbox, next.bbox);
  merged.lines.reserve(current.lines.size() + next.lines.size());
  merged.lines.insert(merged.lines.end(), current.lines.begin(),
                      current.lines.end());
  merged.lines.insert(merged.lines.end(), next.lines.begin(),
                      next.lines.end());
  return merged;
}

} // anonymous namespace

std::vector<TextBlock> mergeTextBlocks(const std::vector<RawBlock> &blocks,
                                       double verticalThreshold) {
  std::vector<const RawBlock *> sorted;
  sorted.reserve(blocks.size());
  for (const auto &block : blocks) {
    if (block.kind == BlockKind::Text && block.hasBBox) {
      sorted.push_back(&block);
    }
  }

  // Ties keep document order
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RawBlock *a, const RawBlock *b) {
                     return a->bbox.y0 < b->bbox.y0;
                   });

  std::vector<TextBlock> merged;
  if (sorted.empty()) {
    return merged;
  }

  TextBlock current = toTextBlock(*sorted.front());
  for (size_t i = 1; i < sorted.size(); i++) {
    const RawBlock &next = *sorted[i];
    if (continuesParagraph(current, next, verticalThreshold)) {
      current = appendBlock(current, next);
    } else {
      merged.push_back(std::move(current));
      current = toTextBlock(next);
    }
  }
  merged.push_back(std::move(current));

  return merged;
}

} // namespace a11y
