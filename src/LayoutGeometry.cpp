#include "LayoutGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace a11y {

Rect snapRectExpandAndClamp(const Rect &rect, const Rect &pageRect,
                            double gridSize) {
  Rect snapped = rect;
  // An axis without extent is left as is, so rectangles collapsed onto an
  // off-grid page edge stay put when snapped again
  if (gridSize > 0 && rect.x1 > rect.x0) {
    snapped.x0 = std::floor(rect.x0 / gridSize) * gridSize;
    snapped.x1 = std::ceil(rect.x1 / gridSize) * gridSize;
  }
  if (gridSize > 0 && rect.y1 > rect.y0) {
    snapped.y0 = std::floor(rect.y0 / gridSize) * gridSize;
    snapped.y1 = std::ceil(rect.y1 / gridSize) * gridSize;
  }

  // Clamp every edge into the page. Each edge is clamped on both sides so a
  // rectangle outside the page ends up on its boundary instead of inverted.
  Rect clamped;
  clamped.x0 = std::clamp(snapped.x0, pageRect.x0, pageRect.x1);
  clamped.y0 = std::clamp(snapped.y0, pageRect.y0, pageRect.y1);
  clamped.x1 = std::clamp(snapped.x1, pageRect.x0, pageRect.x1);
  clamped.y1 = std::clamp(snapped.y1, pageRect.y0, pageRect.y1);

  // A degenerate input (x1 < x0 after clamping) collapses to zero width
  clamped.x1 = std::max(clamped.x1, clamped.x0);
  clamped.y1 = std::max(clamped.y1, clamped.y0);
  return clamped;
}

Rect unite(const Rect &a, const Rect &b) {
  return Rect(std::min(a.x0, b.x0), std::min(a.y0, b.y0),
              std::max(a.x1, b.x1), std::max(a.y1, b.y1));
}

Rect intersect(const Rect &a, const Rect &b) {
  Rect r(std::max(a.x0, b.x0), std::max(a.y0, b.y0), std::min(a.x1, b.x1),
         std::min(a.y1, b.y1));
  if (r.isEmpty()) {
    return Rect(a.x0, a.y0, a.x0, a.y0);
  }
  return r;
}

double area(const Rect &rect) {
  if (rect.isEmpty()) {
    return 0.0;
  }
  return rect.width() * rect.height();
}

Rect translated(const Rect &rect, double dx, double dy) {
  return Rect(rect.x0 + dx, rect.y0 + dy, rect.x1 + dx, rect.y1 + dy);
}

Rect inset(const Rect &rect, double margin) {
  return Rect(rect.x0 + margin, rect.y0 + margin, rect.x1 - margin,
              rect.y1 - margin);
}

bool contains(const Rect &outer, const Rect &inner) {
  return inner.x0 >= outer.x0 && inner.y0 >= outer.y0 &&
         inner.x1 <= outer.x1 && inner.y1 <= outer.y1;
}

Rect fitKeepingAspect(double contentWidth, double contentHeight,
                      const Rect &frame) {
  if (contentWidth <= 0 || contentHeight <= 0 || frame.isEmpty()) {
    return frame;
  }

  double scale = std::min(frame.width() / contentWidth,
                          frame.height() / contentHeight);
  double w = contentWidth * scale;
  double h = contentHeight * scale;

  // Center inside the frame
  double x = frame.x0 + (frame.width() - w) / 2.0;
  double y = frame.y0 + (frame.height() - h) / 2.0;
  return Rect(x, y, x + w, y + h);
}

} // namespace a11y
