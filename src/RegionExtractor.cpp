#include "RegionExtractor.hpp"
#include "Diagnostics.hpp"

#include <cmath>

namespace a11y {

namespace {

std::vector<RawBlock> blocksOfKind(const PageContent &page, BlockKind kind) {
  std::vector<RawBlock> out;
  for (size_t i = 0; i < page.blocks.size(); i++) {
    const RawBlock &block = page.blocks[i];
    if (block.kind != kind) {
      continue;
    }
    if (!block.hasBBox) {
      debugLog() << "DEBUG: Page " << page.pageNumber << ": block " << i
                 << " has no bounding box, skipping" << std::endl;
      continue;
    }
    out.push_back(block);
  }
  return out;
}

} // anonymous namespace

std::vector<RawBlock> extractTextBlocks(const PageContent &page) {
  return blocksOfKind(page, BlockKind::Text);
}

std::vector<RawBlock> extractImageBlocks(const PageContent &page) {
  return blocksOfKind(page, BlockKind::Image);
}

bool isBackgroundImage(const Rect &bbox, const Rect &pageRect) {
  bool nearFullWidth = bbox.width() >= pageRect.width() * kNearFullPageRatio;
  bool nearFullHeight =
      bbox.height() >= pageRect.height() * kNearFullPageRatio;

  bool alignedLeft = std::abs(bbox.x0 - pageRect.x0) <= kEdgeAlignTolerance;
  bool alignedRight = std::abs(bbox.x1 - pageRect.x1) <= kEdgeAlignTolerance;
  bool alignedTop = std::abs(bbox.y0 - pageRect.y0) <= kEdgeAlignTolerance;
  bool alignedBottom = std::abs(bbox.y1 - pageRect.y1) <= kEdgeAlignTolerance;

  // Header or footer band
  if (nearFullWidth && (alignedTop || alignedBottom)) {
    return true;
  }
  // Sidebar
  if (nearFullHeight && (alignedLeft || alignedRight)) {
    return true;
  }
  // Full-page background
  return nearFullWidth && nearFullHeight && alignedLeft && alignedTop;
}

std::vector<ImageReference> extractImages(const PageContent &page) {
  std::vector<ImageReference> images;

  for (size_t i = 0; i < page.images.size(); i++) {
    const PageImage &img = page.images[i];

    if (!img.resolved) {
      debugLog() << "DEBUG: Page " << page.pageNumber << ": image xref "
                 << img.xref << " has no resolvable placement, skipping"
                 << std::endl;
      continue;
    }

    const Rect &bbox = img.placement;

    // Minimum size filter
    if (bbox.width() < kMinImageSize || bbox.height() < kMinImageSize) {
      debugLog() << "DEBUG: Page " << page.pageNumber << ": image xref "
                 << img.xref << " too small (" << bbox.width() << " x "
                 << bbox.height() << "), skipping" << std::endl;
      continue;
    }

    if (isBackgroundImage(bbox, page.pageRect)) {
      debugLog() << "DEBUG: Page " << page.pageNumber << ": image xref "
                 << img.xref << " looks like a background/band, skipping"
                 << std::endl;
      continue;
    }

    ImageReference ref;
    ref.xref = img.xref;
    ref.bbox = bbox;
    ref.imageIndex = i;
    images.push_back(ref);
  }

  return images;
}

} // namespace a11y
