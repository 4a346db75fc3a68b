#ifndef A11Y_BLOCK_MERGER_HPP
#define A11Y_BLOCK_MERGER_HPP

#include "PageContent.hpp"

#include <vector>

namespace a11y {

/// Maximum difference between left edges (points) for blocks to be merged
constexpr double kMergeLeftEdgeTolerance = 5.0;

/**
 * @brief Merge vertically adjacent, left-aligned text blocks into paragraphs
 *
 * Blocks are stably sorted by their top edge. Walking that order, a block is
 * merged into the current paragraph when the gap between the paragraph's
 * bottom and the block's top is at most verticalThreshold (overlap counts as
 * a negative gap) and the left edges differ by less than
 * kMergeLeftEdgeTolerance. Merging unites the bounding boxes and appends the
 * block's lines. Otherwise the paragraph is emitted and the block starts the
 * next one.
 *
 * The input is not modified. Image blocks and blocks without a bounding box
 * are ignored.
 *
 * @param blocks Raw text blocks in any order
 * @param verticalThreshold Largest vertical gap to merge across (points)
 * @return Merged blocks, ordered by top edge
 */
std::vector<TextBlock> mergeTextBlocks(const std::vector<RawBlock> &blocks,
                                       double verticalThreshold);

} // namespace a11y

#endif // A11Y_BLOCK_MERGER_HPP
