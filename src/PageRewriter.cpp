#include "PageRewriter.hpp"
#include "BlockMerger.hpp"
#include "Diagnostics.hpp"
#include "RegionExtractor.hpp"

#include <deque>
#include <iostream>
#include <set>

namespace a11y {

namespace {

const Color kWhite = Color::gray(1.0);
const Color kBlack = Color::gray(0.0);
const Color kImageFrameColor = Color::gray(0.99);
const Color kOutlineColor = Color::gray(0.9);
const double kImageFrameWidth = 1.0;
const double kOutlineWidth = 0.5;

DrawOp fillRect(DrawOp::Layer layer, const Rect &rect, const Color &color) {
  DrawOp op;
  op.type = DrawOp::FILL_RECT;
  op.layer = layer;
  op.rect = rect;
  op.color = color;
  return op;
}

DrawOp strokeRect(DrawOp::Layer layer, const Rect &rect, const Color &color,
                  double lineWidth) {
  DrawOp op;
  op.type = DrawOp::STROKE_RECT;
  op.layer = layer;
  op.rect = rect;
  op.color = color;
  op.lineWidth = lineWidth;
  return op;
}

bool hasPayload(const PageContent &page, const ImageReference &ref) {
  const PageImage &img = page.images[ref.imageIndex];
  return !img.pixels.empty();
}

void reportDecodeFailure(const PageContent &page, const ImageReference &ref) {
  const PageImage &img = page.images[ref.imageIndex];
  std::cerr << "Error inserting image (page " << page.pageNumber << ", xref "
            << ref.xref << "): "
            << (img.decodeError.empty() ? "no image data" : img.decodeError)
            << std::endl;
}

// Sequential assignment: the first candidate that decodes serves every image
// block. Candidates that fail to decode are dropped from the queue.
class FirstAvailableAssigner {
public:
  FirstAvailableAssigner(const PageContent &page,
                         const std::vector<ImageReference> &images)
      : m_page(page), m_queue(images.begin(), images.end()) {}

  const ImageReference *next(int &failures) {
    while (!m_queue.empty()) {
      if (hasPayload(m_page, m_queue.front())) {
        return &m_queue.front();
      }
      reportDecodeFailure(m_page, m_queue.front());
      failures++;
      m_queue.pop_front();
    }
    return nullptr;
  }

private:
  const PageContent &m_page;
  std::deque<ImageReference> m_queue;
};

// Each block gets the decodable candidate covering most of it. A candidate
// that fails to decode is reported once per page.
class OverlapAssigner {
public:
  OverlapAssigner(const PageContent &page,
                  const std::vector<ImageReference> &images)
      : m_page(page), m_images(images) {}

  const ImageReference *next(const Rect &frame, int &failures) {
    const ImageReference *best = nullptr;
    double bestArea = 0.0;
    for (const auto &ref : m_images) {
      double overlap = area(intersect(ref.bbox, frame));
      if (overlap <= bestArea) {
        continue;
      }
      if (!hasPayload(m_page, ref)) {
        if (m_reported.insert(ref.imageIndex).second) {
          reportDecodeFailure(m_page, ref);
          failures++;
        }
        continue;
      }
      best = &ref;
      bestArea = overlap;
    }
    return best;
  }

private:
  const PageContent &m_page;
  const std::vector<ImageReference> &m_images;
  std::set<size_t> m_reported;
};

void planImageLayer(const PageContent &page, const RewriteOptions &options,
                    PagePlan &plan) {
  FirstAvailableAssigner firstAvailable(page, plan.images);
  OverlapAssigner overlap(page, plan.images);

  for (const auto &block : extractImageBlocks(page)) {
    plan.imageBlockCount++;
    plan.ops.push_back(strokeRect(DrawOp::IMAGE_FRAME, block.bbox,
                                  kImageFrameColor, kImageFrameWidth));

    // Collapsed placements have nowhere to put pixels
    if (block.bbox.isEmpty()) {
      debugLog() << "DEBUG: Page " << page.pageNumber
                 << ": empty image block at (" << block.bbox.x0 << ", "
                 << block.bbox.y0 << ")" << std::endl;
      continue;
    }

    const ImageReference *ref = nullptr;
    if (options.imageAssignment == ImageAssignment::AreaOverlap) {
      ref = overlap.next(block.bbox, plan.imageFailures);
    } else {
      ref = firstAvailable.next(plan.imageFailures);
    }

    if (!ref) {
      debugLog() << "DEBUG: Page " << page.pageNumber
                 << ": no image payload for block at (" << block.bbox.x0
                 << ", " << block.bbox.y0 << ")" << std::endl;
      continue;
    }

    DrawOp op;
    op.type = DrawOp::IMAGE;
    op.layer = DrawOp::IMAGE_CONTENT;
    op.rect = block.bbox;
    op.imageIndex = ref->imageIndex;
    op.keepAspect = true;
    plan.ops.push_back(op);
    plan.imagesPlaced++;
  }
}

void planTextLayer(const PageContent &page, const RewriteOptions &options,
                   PagePlan &plan) {
  const double margin = options.margin;

  for (const auto &block : plan.mergedBlocks) {
    const Rect &r = block.bbox;

    // Skip very small blocks (artifacts, icons)
    if (r.height() < options.minBlockHeight ||
        r.width() < options.minBlockWidth) {
      plan.textBlocksSkipped++;
      continue;
    }
    plan.textBlocksDrawn++;

    // Grid snapping only ever grows the block, so the snapped rectangle is
    // cut back to the block: the outline stays inside it and on the page
    Rect bounded = intersect(
        snapRectExpandAndClamp(r, page.pageRect, options.gridSize), r);
    Rect outline = inset(bounded, margin);
    plan.ops.push_back(
        strokeRect(DrawOp::OUTLINE, outline, kOutlineColor, kOutlineWidth));

    for (const auto &line : block.lines) {
      for (const auto &span : line.spans) {
        std::string text = trimmed(span.text);
        if (text.empty()) {
          continue;
        }

        plan.ops.push_back(fillRect(DrawOp::TEXT_PANEL,
                                    translated(span.bbox, margin, margin),
                                    kWhite));

        DrawOp op;
        op.type = DrawOp::TEXT;
        op.layer = DrawOp::GLYPHS;
        op.origin = Point{span.origin.x + margin, span.origin.y + margin};
        op.rect = translated(span.bbox, margin, margin);
        op.text = text;
        op.fontFamily = options.fontFamily;
        op.fontSize = span.fontSize;
        op.color = kBlack;
        plan.ops.push_back(op);
        plan.spansDrawn++;
      }
    }
  }
}

} // anonymous namespace

std::string trimmed(const std::string &text) {
  const char *whitespace = " \t\r\n\f\v";
  size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return std::string();
  }
  size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

PagePlan planPage(const PageContent &page, const RewriteOptions &options) {
  PagePlan plan;
  plan.pageRect = page.pageRect;

  // Structure is read before the page is erased
  plan.mergedBlocks =
      mergeTextBlocks(extractTextBlocks(page), options.mergeThreshold);
  plan.images = extractImages(page);

  // Step 1: erase
  plan.ops.push_back(fillRect(DrawOp::ERASE, page.pageRect, kWhite));

  // Step 2: images (bottom layer)
  planImageLayer(page, options, plan);

  // Step 3: outlines, text panels and text
  planTextLayer(page, options, plan);

  debugLog() << "DEBUG: Page " << page.pageNumber << " plan: "
             << plan.mergedBlocks.size() << " merged blocks ("
             << plan.textBlocksSkipped << " skipped), "
             << plan.imageBlockCount << " image blocks, "
             << plan.imagesPlaced << " images placed, " << plan.ops.size()
             << " draw operations" << std::endl;

  return plan;
}

PagePlan rewritePage(const PageContent &page, PagePainter &painter,
                     const RewriteOptions &options) {
  PagePlan plan = planPage(page, options);

  painter.beginPage(page.pageRect);
  for (const auto &op : plan.ops) {
    if (!painter.paint(op, page)) {
      if (op.type == DrawOp::IMAGE) {
        plan.imagesPlaced--;
        plan.imageFailures++;
      } else if (op.type == DrawOp::TEXT) {
        plan.spansDrawn--;
      }
      debugLog() << "DEBUG: Page " << page.pageNumber
                 << ": draw operation skipped" << std::endl;
    }
  }
  painter.endPage();

  return plan;
}

} // namespace a11y
