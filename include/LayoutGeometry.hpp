#ifndef A11Y_LAYOUT_GEOMETRY_HPP
#define A11Y_LAYOUT_GEOMETRY_HPP

namespace a11y {

/**
 * @brief Axis-aligned rectangle in page space
 *
 * Origin is the top-left corner of the page, y grows downward and units are
 * PDF points. A normalized rectangle has x0 <= x1 and y0 <= y1.
 */
struct Rect {
  double x0 = 0.0; ///< Left edge
  double y0 = 0.0; ///< Top edge
  double x1 = 0.0; ///< Right edge
  double y1 = 0.0; ///< Bottom edge

  Rect() = default;
  Rect(double left, double top, double right, double bottom)
      : x0(left), y0(top), x1(right), y1(bottom) {}

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }

  /// True when the rectangle has no area (zero or negative extent)
  bool isEmpty() const { return x1 <= x0 || y1 <= y0; }

  bool operator==(const Rect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const Rect &other) const { return !(*this == other); }
};

/**
 * @brief A point in page space (top-left origin, points)
 */
struct Point {
  double x = 0.0;
  double y = 0.0;
};

/**
 * @brief Expand a rectangle outward to a layout grid and clamp it to the page
 *
 * The top-left corner is floored and the bottom-right corner is ceiled to the
 * nearest multiple of gridSize, then every edge is clamped into pageRect. The
 * result is always contained in pageRect. A rectangle lying outside the page
 * collapses onto the page boundary and may have zero area. An axis with no
 * extent is clamped but not snapped, which keeps the operation idempotent.
 *
 * @param rect Rectangle to snap
 * @param pageRect Enclosing page rectangle
 * @param gridSize Grid pitch in points; values <= 0 skip snapping (clamp only)
 * @return Snapped and clamped rectangle
 */
Rect snapRectExpandAndClamp(const Rect &rect, const Rect &pageRect,
                            double gridSize);

/// Smallest rectangle containing both a and b
Rect unite(const Rect &a, const Rect &b);

/// Overlapping part of a and b (empty rectangle at a's origin if disjoint)
Rect intersect(const Rect &a, const Rect &b);

/// Area of the rectangle, 0 for empty rectangles
double area(const Rect &rect);

/// Rectangle moved by (dx, dy)
Rect translated(const Rect &rect, double dx, double dy);

/// Rectangle shrunk by margin on all four sides
Rect inset(const Rect &rect, double margin);

/// True when inner lies fully inside outer (edges may touch)
bool contains(const Rect &outer, const Rect &inner);

/**
 * @brief Place content of the given size inside a frame, keeping its aspect
 * ratio
 *
 * The content is scaled uniformly to the largest size that fits the frame and
 * centered on both axes.
 *
 * @param contentWidth Content width (any unit, > 0)
 * @param contentHeight Content height (same unit, > 0)
 * @param frame Target frame
 * @return Target rectangle inside frame; the frame itself if the content has
 * no extent
 */
Rect fitKeepingAspect(double contentWidth, double contentHeight,
                      const Rect &frame);

} // namespace a11y

#endif // A11Y_LAYOUT_GEOMETRY_HPP
