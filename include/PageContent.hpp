#ifndef A11Y_PAGE_CONTENT_HPP
#define A11Y_PAGE_CONTENT_HPP

#include "LayoutGeometry.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace a11y {

/**
 * @brief A run of positioned text sharing one font size
 */
struct TextSpan {
  Point origin;          ///< Baseline start of the run
  Rect bbox;             ///< Bounding box of the run
  double fontSize = 0.0; ///< Font size in points
  std::string fontName;  ///< Source font name (informational only)
  std::string text;      ///< UTF-8 text content
};

/**
 * @brief One line of text, spans in left-to-right reading order
 */
struct TextLine {
  std::vector<TextSpan> spans;
};

/**
 * @brief A paragraph-like text region
 */
struct TextBlock {
  Rect bbox;                   ///< Bounding box of all lines
  std::vector<TextLine> lines; ///< Lines in reading order
};

/**
 * @brief Kind of a block in the page's content description
 */
enum class BlockKind {
  Text, ///< Text-bearing block with lines and spans
  Image ///< Image placement
};

/**
 * @brief One block of the page's structured content, as read from the page
 *
 * Blocks read from malformed content may lack a bounding box; consumers skip
 * those.
 */
struct RawBlock {
  BlockKind kind = BlockKind::Text;
  bool hasBBox = false;        ///< Whether bbox is valid
  Rect bbox;                   ///< Bounding box (valid when hasBBox)
  std::vector<TextLine> lines; ///< Lines (text blocks only)
  int xref = -1; ///< Image object number (image blocks; -1 for inline images)
};

/**
 * @brief An entry of the page's image list with its decoded payload
 */
struct PageImage {
  int xref = -1;          ///< Image object number
  bool resolved = false;  ///< Whether the placement rectangle was resolved
  Rect placement;         ///< Placement on the page (valid when resolved)
  cv::Mat pixels;         ///< Decoded payload (BGR), empty if decoding failed
  std::string decodeError; ///< Reason the payload could not be decoded
};

/**
 * @brief An image kept after filtering, with its placement rectangle
 */
struct ImageReference {
  int xref = -1;   ///< Image object number
  Rect bbox;       ///< Placement on the page
  size_t imageIndex = 0; ///< Index into PageContent::images
};

/**
 * @brief Structured content of a single source page
 *
 * Created fresh for every page and discarded once the page has been
 * rewritten. Nothing here is shared across pages.
 */
struct PageContent {
  int pageNumber = 0;              ///< 1-indexed page number
  Rect pageRect;                   ///< Page rectangle (top-left origin)
  std::vector<RawBlock> blocks;    ///< Text and image blocks, document order
  std::vector<PageImage> images;   ///< Image list, one entry per image object
};

} // namespace a11y

#endif // A11Y_PAGE_CONTENT_HPP
