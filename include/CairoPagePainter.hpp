#ifndef A11Y_CAIRO_PAGE_PAINTER_HPP
#define A11Y_CAIRO_PAGE_PAINTER_HPP

#include "PageRewriter.hpp"

#include <cairo.h>

#include <string>

namespace a11y {

/**
 * @brief Paints page plans into a multi-page PDF with Cairo
 *
 * Each beginPage()/endPage() pair produces one output page sized to the
 * source page. finish() must be called to flush the file; destroying the
 * painter without finish() closes the surface without checking for errors.
 */
class CairoPagePainter : public PagePainter {
public:
  /**
   * @brief Create the output PDF surface
   * @param outputPath File to write
   * @throws std::runtime_error if the surface cannot be created
   */
  explicit CairoPagePainter(const std::string &outputPath);
  ~CairoPagePainter() override;

  CairoPagePainter(const CairoPagePainter &) = delete;
  CairoPagePainter &operator=(const CairoPagePainter &) = delete;

  void beginPage(const Rect &pageRect) override;
  /**
   * @brief Paint one operation
   *
   * Images without a payload or with an empty placement, and text that is not
   * valid UTF-8, are refused before anything reaches Cairo.
   *
   * @return false if the operation was not drawn
   */
  bool paint(const DrawOp &op, const PageContent &page) override;
  void endPage() override;

  /**
   * @brief Flush and close the PDF file
   * @throws std::runtime_error if Cairo reports a write error
   */
  void finish();

  /// Number of pages finished so far
  int pageCount() const { return m_pageCount; }

private:
  bool paintImage(const DrawOp &op, const PageContent &page);
  bool paintText(const DrawOp &op);

  std::string m_outputPath;
  cairo_surface_t *m_surface;
  cairo_t *m_cr;
  bool m_pageOpen;
  int m_pageCount;
};

} // namespace a11y

#endif // A11Y_CAIRO_PAGE_PAINTER_HPP
