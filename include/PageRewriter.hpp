#ifndef A11Y_PAGE_REWRITER_HPP
#define A11Y_PAGE_REWRITER_HPP

#include "PageContent.hpp"

#include <string>
#include <vector>

namespace a11y {

/**
 * @brief How image payloads are assigned to the page's image blocks
 */
enum class ImageAssignment {
  /// Every image block receives the first payload that decodes, in image
  /// list order. Pages with several image blocks may show the same picture
  /// in each of them.
  FirstAvailable,
  /// Each image block receives the retained image whose placement overlaps
  /// it the most; blocks without an overlapping image get none.
  AreaOverlap
};

/**
 * @brief Tunables for page reconstruction
 */
struct RewriteOptions {
  double gridSize = 20.0;       ///< Layout grid for outline clamping (points)
  double mergeThreshold = 30.0; ///< Vertical gap merged across (points)
  double margin = 3.0;          ///< Outline inset and text offset (points)
  double minBlockHeight = 5.0;  ///< Smaller merged blocks are skipped
  double minBlockWidth = 10.0;  ///< Narrower merged blocks are skipped
  std::string fontFamily = "Sans"; ///< Typeface for all redrawn text
  ImageAssignment imageAssignment = ImageAssignment::FirstAvailable;
};

/**
 * @brief RGB colour, components in [0, 1]
 */
struct Color {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;

  static Color gray(double level) { return Color{level, level, level}; }
};

/**
 * @brief One drawing step of a reconstructed page
 *
 * Operations are executed in plan order; later operations paint over earlier
 * ones.
 */
struct DrawOp {
  enum Type { FILL_RECT, STROKE_RECT, IMAGE, TEXT };

  /// Which part of the page this step belongs to
  enum Layer { ERASE, IMAGE_FRAME, IMAGE_CONTENT, OUTLINE, TEXT_PANEL, GLYPHS };

  Type type = FILL_RECT;
  Layer layer = ERASE;
  Rect rect;             ///< Target rectangle (all but TEXT)
  Color color;           ///< Fill, stroke or text colour
  double lineWidth = 0;  ///< Stroke width (STROKE_RECT)
  size_t imageIndex = 0; ///< Payload index into PageContent::images (IMAGE)
  bool keepAspect = true; ///< Preserve payload aspect ratio (IMAGE)

  // Text-specific fields
  Point origin;           ///< Baseline start (TEXT)
  std::string text;       ///< Text to draw (TEXT)
  std::string fontFamily; ///< Typeface (TEXT)
  double fontSize = 0.0;  ///< Font size in points (TEXT)
};

/**
 * @brief Ordered draw operations for one page, plus what went into them
 */
struct PagePlan {
  Rect pageRect;
  std::vector<DrawOp> ops;

  std::vector<TextBlock> mergedBlocks;  ///< Merged text blocks of the page
  std::vector<ImageReference> images;   ///< Images kept after filtering

  int imageBlockCount = 0;   ///< Image blocks framed
  int imagesPlaced = 0;      ///< Image blocks that received a payload
  int imageFailures = 0;     ///< Payloads skipped because they did not decode
  int textBlocksDrawn = 0;   ///< Merged blocks redrawn
  int textBlocksSkipped = 0; ///< Merged blocks dropped as too small
  int spansDrawn = 0;        ///< Text spans redrawn
};

/**
 * @brief Executes draw operations onto an output page
 */
class PagePainter {
public:
  virtual ~PagePainter() = default;

  /// Start a new output page of the given size
  virtual void beginPage(const Rect &pageRect) = 0;

  /**
   * @brief Paint one operation
   * @param op Operation to paint
   * @param page Source page; IMAGE operations take their payload from it
   * @return false if the operation could not be painted (the page continues)
   */
  virtual bool paint(const DrawOp &op, const PageContent &page) = 0;

  /// Finish the current page
  virtual void endPage() = 0;
};

/**
 * @brief Plan the reconstruction of one page
 *
 * The plan is strictly ordered:
 *  1. erase the page to white,
 *  2. frame every image block and place an image payload inside it,
 *  3. for each merged text block large enough to keep, draw a light outline
 *     (the block inset by the margin, kept on the page) and, for each
 *     non-blank span, a white panel followed by black text,
 *     both shifted by the margin.
 *
 * @param page Page content description
 * @param options Reconstruction tunables
 * @return Ordered draw plan
 */
PagePlan planPage(const PageContent &page, const RewriteOptions &options);

/**
 * @brief Plan a page and paint it
 *
 * Operations the painter fails to paint are logged and skipped.
 *
 * @param page Page content description
 * @param painter Output painter
 * @param options Reconstruction tunables
 * @return The executed plan
 */
PagePlan rewritePage(const PageContent &page, PagePainter &painter,
                     const RewriteOptions &options);

/// Copy of text with leading and trailing whitespace removed
std::string trimmed(const std::string &text);

} // namespace a11y

#endif // A11Y_PAGE_REWRITER_HPP
