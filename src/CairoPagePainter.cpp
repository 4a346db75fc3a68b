#include "CairoPagePainter.hpp"
#include "Diagnostics.hpp"
#include "TextEncoding.hpp"

#include <cairo-pdf.h>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <stdexcept>

namespace a11y {

namespace {

// Default size used for spans that carry no font size
const double kFallbackFontSize = 10.0;

void setColor(cairo_t *cr, const Color &color) {
  cairo_set_source_rgb(cr, color.r, color.g, color.b);
}

void addRect(cairo_t *cr, const Rect &rect) {
  cairo_rectangle(cr, rect.x0, rect.y0, rect.width(), rect.height());
}

} // anonymous namespace

CairoPagePainter::CairoPagePainter(const std::string &outputPath)
    : m_outputPath(outputPath), m_surface(nullptr), m_cr(nullptr),
      m_pageOpen(false), m_pageCount(0) {
  // The real page size is set per page in beginPage()
  m_surface = cairo_pdf_surface_create(outputPath.c_str(), 612.0, 792.0);
  if (cairo_surface_status(m_surface) != CAIRO_STATUS_SUCCESS) {
    std::string reason =
        cairo_status_to_string(cairo_surface_status(m_surface));
    cairo_surface_destroy(m_surface);
    m_surface = nullptr;
    throw std::runtime_error("Failed to create PDF output " + outputPath +
                             ": " + reason);
  }

  m_cr = cairo_create(m_surface);
  if (cairo_status(m_cr) != CAIRO_STATUS_SUCCESS) {
    std::string reason = cairo_status_to_string(cairo_status(m_cr));
    cairo_destroy(m_cr);
    cairo_surface_destroy(m_surface);
    m_cr = nullptr;
    m_surface = nullptr;
    throw std::runtime_error("Failed to create Cairo context: " + reason);
  }
}

CairoPagePainter::~CairoPagePainter() {
  if (m_cr) {
    cairo_destroy(m_cr);
  }
  if (m_surface) {
    cairo_surface_destroy(m_surface);
  }
}

void CairoPagePainter::beginPage(const Rect &pageRect) {
  if (m_pageOpen) {
    endPage();
  }

  cairo_pdf_surface_set_size(m_surface, pageRect.width(), pageRect.height());
  cairo_identity_matrix(m_cr);
  cairo_translate(m_cr, -pageRect.x0, -pageRect.y0);
  m_pageOpen = true;
}

bool CairoPagePainter::paint(const DrawOp &op, const PageContent &page) {
  switch (op.type) {
  case DrawOp::FILL_RECT:
    setColor(m_cr, op.color);
    addRect(m_cr, op.rect);
    cairo_fill(m_cr);
    return true;

  case DrawOp::STROKE_RECT:
    setColor(m_cr, op.color);
    cairo_set_line_width(m_cr, op.lineWidth);
    addRect(m_cr, op.rect);
    cairo_stroke(m_cr);
    return true;

  case DrawOp::IMAGE:
    return paintImage(op, page);

  case DrawOp::TEXT:
    return paintText(op);
  }
  return false;
}

bool CairoPagePainter::paintImage(const DrawOp &op, const PageContent &page) {
  if (op.imageIndex >= page.images.size()) {
    std::cerr << "Error inserting image: no image " << op.imageIndex
              << " on page " << page.pageNumber << std::endl;
    return false;
  }

  const PageImage &img = page.images[op.imageIndex];
  if (img.pixels.empty()) {
    std::cerr << "Error inserting image xref " << img.xref
              << ": no image data" << std::endl;
    return false;
  }

  // A zero scale would leave the context in a permanent error state
  Rect target = op.keepAspect
                    ? fitKeepingAspect(img.pixels.cols, img.pixels.rows, op.rect)
                    : op.rect;
  if (op.rect.isEmpty() || target.isEmpty()) {
    std::cerr << "Error inserting image xref " << img.xref
              << ": empty placement (" << op.rect.x0 << ", " << op.rect.y0
              << ") - (" << op.rect.x1 << ", " << op.rect.y1 << ")"
              << std::endl;
    return false;
  }

  cairo_surface_t *imgSurface = nullptr;
  try {
    // Convert to RGB
    cv::Mat rgbImage;
    if (img.pixels.channels() == 1) {
      cv::cvtColor(img.pixels, rgbImage, cv::COLOR_GRAY2RGB);
    } else if (img.pixels.channels() == 3) {
      cv::cvtColor(img.pixels, rgbImage, cv::COLOR_BGR2RGB);
    } else if (img.pixels.channels() == 4) {
      cv::cvtColor(img.pixels, rgbImage, cv::COLOR_BGRA2RGB);
    } else {
      std::cerr << "Error inserting image xref " << img.xref << ": "
                << img.pixels.channels() << " channels not supported"
                << std::endl;
      return false;
    }

    imgSurface = cairo_image_surface_create(CAIRO_FORMAT_RGB24, rgbImage.cols,
                                            rgbImage.rows);
    if (cairo_surface_status(imgSurface) != CAIRO_STATUS_SUCCESS) {
      std::cerr << "Error inserting image xref " << img.xref << ": "
                << cairo_status_to_string(cairo_surface_status(imgSurface))
                << std::endl;
      cairo_surface_destroy(imgSurface);
      return false;
    }

    cairo_surface_flush(imgSurface);
    unsigned char *data = cairo_image_surface_get_data(imgSurface);
    int stride = cairo_image_surface_get_stride(imgSurface);

    // Cairo RGB24 is BGRX in memory on little-endian hosts
    for (int row = 0; row < rgbImage.rows; row++) {
      for (int col = 0; col < rgbImage.cols; col++) {
        cv::Vec3b pixel = rgbImage.at<cv::Vec3b>(row, col);
        int offset = row * stride + col * 4;
        data[offset + 0] = pixel[2]; // B
        data[offset + 1] = pixel[1]; // G
        data[offset + 2] = pixel[0]; // R
        data[offset + 3] = 255;
      }
    }
    cairo_surface_mark_dirty(imgSurface);

    cairo_save(m_cr);
    cairo_translate(m_cr, target.x0, target.y0);
    cairo_scale(m_cr, target.width() / static_cast<double>(rgbImage.cols),
                target.height() / static_cast<double>(rgbImage.rows));
    cairo_set_source_surface(m_cr, imgSurface, 0, 0);
    cairo_paint(m_cr);
    cairo_restore(m_cr);

    cairo_surface_destroy(imgSurface);
  } catch (const std::exception &e) {
    std::cerr << "Error inserting image xref " << img.xref << ": " << e.what()
              << std::endl;
    if (imgSurface) {
      cairo_surface_destroy(imgSurface);
    }
    return false;
  }

  cairo_status_t status = cairo_status(m_cr);
  if (status != CAIRO_STATUS_SUCCESS) {
    std::cerr << "Error inserting image xref " << img.xref << ": "
              << cairo_status_to_string(status) << std::endl;
    return false;
  }

  debugLog() << "DEBUG: Placed image xref " << img.xref << " in ("
             << op.rect.x0 << ", " << op.rect.y0 << ") - (" << op.rect.x1
             << ", " << op.rect.y1 << ")" << std::endl;
  return true;
}

bool CairoPagePainter::paintText(const DrawOp &op) {
  // Cairo refuses malformed strings and stops drawing altogether
  if (!isDrawableUtf8(op.text)) {
    std::cerr << "Error drawing text at (" << op.origin.x << ", "
              << op.origin.y << "): invalid UTF-8" << std::endl;
    return false;
  }

  setColor(m_cr, op.color);
  cairo_select_font_face(m_cr, op.fontFamily.c_str(), CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(m_cr, op.fontSize > 0 ? op.fontSize : kFallbackFontSize);
  cairo_move_to(m_cr, op.origin.x, op.origin.y);
  cairo_show_text(m_cr, op.text.c_str());

  cairo_status_t status = cairo_status(m_cr);
  if (status != CAIRO_STATUS_SUCCESS) {
    std::cerr << "Error drawing text at (" << op.origin.x << ", "
              << op.origin.y << "): " << cairo_status_to_string(status)
              << std::endl;
    return false;
  }
  return true;
}

void CairoPagePainter::endPage() {
  if (!m_pageOpen) {
    return;
  }
  cairo_show_page(m_cr);
  m_pageOpen = false;
  m_pageCount++;
}

void CairoPagePainter::finish() {
  if (m_pageOpen) {
    endPage();
  }

  cairo_status_t status = cairo_status(m_cr);
  if (status != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error("Rendering failed: " +
                             std::string(cairo_status_to_string(status)));
  }

  cairo_surface_finish(m_surface);
  status = cairo_surface_status(m_surface);
  if (status != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error("Failed to write " + m_outputPath + ": " +
                             cairo_status_to_string(status));
  }
}

} // namespace a11y
