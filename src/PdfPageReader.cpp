#include "PdfPageReader.hpp"
#include "Diagnostics.hpp"
#include "TextEncoding.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

// Poppler low-level API
#include <GfxState.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Stream.h>
#include <TextOutputDev.h>
#include <goo/GooString.h>

namespace a11y {

namespace {

// All pages are displayed at 72 DPI so that device units are PDF points
const double kPointsDpi = 72.0;

// Words of one line whose sizes differ by less than this share a span
const double kSpanFontSizeTolerance = 0.01;

std::string wordText(const TextWord *word) {
  std::string text;
  // Code points that cannot be drawn come out as U+FFFD
  for (int i = 0; i < word->getLength(); i++) {
    appendUtf8(text, *word->getChar(i));
  }
  return text;
}

std::string wordFontName(const TextWord *word) {
  if (word->getLength() == 0) {
    return std::string();
  }
  const TextFontInfo *info = word->getFontInfo(0);
  if (!info || !info->getFontName()) {
    return std::string();
  }
  return std::string(info->getFontName()->c_str());
}

// Group the words of a line into spans of equal font and size
TextLine convertLine(const ::TextLine *line) {
  TextLine out;
  bool spaceBefore = false;

  for (const TextWord *word = line->getWords(); word; word = word->getNext()) {
    std::string text = wordText(word);
    std::string fontName = wordFontName(word);
    double fontSize = word->getFontSize();

    double xMin, yMin, xMax, yMax;
    word->getBBox(&xMin, &yMin, &xMax, &yMax);
    Rect bbox(xMin, yMin, xMax, yMax);

    bool startsSpan =
        out.spans.empty() ||
        std::abs(out.spans.back().fontSize - fontSize) >=
            kSpanFontSizeTolerance ||
        out.spans.back().fontName != fontName;

    if (startsSpan) {
      TextSpan span;
      span.origin = Point{xMin, word->getBaseline()};
      span.bbox = bbox;
      span.fontSize = fontSize;
      span.fontName = fontName;
      span.text = text;
      out.spans.push_back(span);
    } else {
      TextSpan &span = out.spans.back();
      if (spaceBefore) {
        span.text += ' ';
      }
      span.text += text;
      span.bbox = unite(span.bbox, bbox);
    }

    spaceBefore = word->getSpaceAfter();
  }

  return out;
}

// Releases the reference returned by TextOutputDev::takeText()
struct TextPageRelease {
  void operator()(TextPage *page) const { page->decRefCnt(); }
};

// Axis-aligned bounding box of the unit square mapped through the CTM
bool imageBounds(GfxState *state, Rect &bbox) {
  const auto &ctm = state->getCTM();

  double xs[4] = {ctm[4], ctm[4] + ctm[0], ctm[4] + ctm[2],
                  ctm[4] + ctm[0] + ctm[2]};
  double ys[4] = {ctm[5], ctm[5] + ctm[1], ctm[5] + ctm[3],
                  ctm[5] + ctm[1] + ctm[3]};

  for (int i = 0; i < 4; i++) {
    if (!std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
      return false;
    }
  }

  bbox.x0 = std::min({xs[0], xs[1], xs[2], xs[3]});
  bbox.y0 = std::min({ys[0], ys[1], ys[2], ys[3]});
  bbox.x1 = std::max({xs[0], xs[1], xs[2], xs[3]});
  bbox.y1 = std::max({ys[0], ys[1], ys[2], ys[3]});
  return true;
}

// Custom OutputDev recording every image drawn on a page
class ImageCollectorOutputDev : public OutputDev {
public:
  explicit ImageCollectorOutputDev(PageContent &contentA)
      : content(contentA) {}

  // Top-left origin, matching TextOutputDev
  bool upsideDown() override { return true; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool /*interpolate*/,
                 const int * /*maskColors*/, bool inlineImg) override {
    recordImage(state, inlineImg ? nullptr : ref, str, width, height,
                colorMap);
  }

  void drawMaskedImage(GfxState *state, Object *ref, Stream *str, int width,
                       int height, GfxImageColorMap *colorMap,
                       bool /*interpolate*/, Stream * /*maskStr*/,
                       int /*maskWidth*/, int /*maskHeight*/,
                       bool /*maskInvert*/,
                       bool /*maskInterpolate*/) override {
    recordImage(state, ref, str, width, height, colorMap);
  }

  void drawSoftMaskedImage(GfxState *state, Object *ref, Stream *str,
                           int width, int height, GfxImageColorMap *colorMap,
                           bool /*interpolate*/, Stream * /*maskStr*/,
                           int /*maskWidth*/, int /*maskHeight*/,
                           GfxImageColorMap * /*maskColorMap*/,
                           bool /*maskInterpolate*/) override {
    recordImage(state, ref, str, width, height, colorMap);
  }

private:
  void recordImage(GfxState *state, Object *ref, Stream *str, int width,
                   int height, GfxImageColorMap *colorMap) {
    int xref = (ref && ref->isRef()) ? ref->getRefNum() : -1;

    RawBlock block;
    block.kind = BlockKind::Image;
    block.xref = xref;
    block.hasBBox = imageBounds(state, block.bbox);
    content.blocks.push_back(block);

    debugLog() << "DEBUG: Image xref " << xref << " (" << width << "x"
               << height << ") at (" << block.bbox.x0 << ", "
               << block.bbox.y0 << ") - (" << block.bbox.x1 << ", "
               << block.bbox.y1 << ")" << std::endl;

    // Inline images have no object number and are not part of the image list
    if (xref < 0) {
      return;
    }
    // The image list holds the first placement of each image object
    if (seen.count(xref) > 0) {
      return;
    }
    seen[xref] = content.images.size();

    PageImage img;
    img.xref = xref;
    img.resolved = block.hasBBox;
    img.placement = block.bbox;
    decode(str, width, height, colorMap, img);
    content.images.push_back(std::move(img));
  }

  static void decode(Stream *str, int width, int height,
                     GfxImageColorMap *colorMap, PageImage &img) {
    if (width <= 0 || height <= 0 || !colorMap || !colorMap->isOk()) {
      img.decodeError = "invalid image dimensions or colour space";
      return;
    }

    try {
      int nComps = colorMap->getNumPixelComps();
      int nBits = colorMap->getBits();

      ImageStream imgStr(str, width, nComps, nBits);
      imgStr.reset();

      // Always decode to 3-channel BGR
      cv::Mat mat(height, width, CV_8UC3);
      GfxRGB rgb;

      for (int row = 0; row < height; row++) {
        unsigned char *line = imgStr.getLine();
        if (!line) {
          imgStr.close();
          img.decodeError = "image data ends after " + std::to_string(row) +
                            " of " + std::to_string(height) + " rows";
          return;
        }

        unsigned char *imgRow = mat.ptr<unsigned char>(row);
        for (int col = 0; col < width; col++) {
          colorMap->getRGB(&line[col * nComps], &rgb);
          imgRow[col * 3 + 0] = colToByte(rgb.b);
          imgRow[col * 3 + 1] = colToByte(rgb.g);
          imgRow[col * 3 + 2] = colToByte(rgb.r);
        }
      }

      imgStr.close();
      img.pixels = mat;
    } catch (const std::exception &e) {
      img.pixels.release();
      img.decodeError = e.what();
    }
  }

  PageContent &content;
  std::map<int, size_t> seen;
};

} // anonymous namespace

PdfPageReader::PdfPageReader(PDFDoc &doc) : m_doc(doc) {}

int PdfPageReader::pageCount() const { return m_doc.getNumPages(); }

Rect PdfPageReader::pageRect(int pageNumber) const {
  double width = m_doc.getPageCropWidth(pageNumber);
  double height = m_doc.getPageCropHeight(pageNumber);
  if (m_doc.getPageRotate(pageNumber) % 180 != 0) {
    std::swap(width, height);
  }
  return Rect(0.0, 0.0, width, height);
}

PageContent PdfPageReader::readPage(int pageNumber) {
  if (pageNumber < 1 || pageNumber > pageCount()) {
    throw std::runtime_error("Page " + std::to_string(pageNumber) +
                             " is out of range (document has " +
                             std::to_string(pageCount()) + " pages)");
  }

  PageContent content;
  content.pageNumber = pageNumber;
  content.pageRect = pageRect(pageNumber);

  debugLog() << "DEBUG: Reading page " << pageNumber << " ("
             << content.pageRect.width() << " x "
             << content.pageRect.height() << " pt)" << std::endl;

  readText(pageNumber, content);
  readImages(pageNumber, content);

  debugLog() << "DEBUG: Page " << pageNumber << ": " << content.blocks.size()
             << " blocks, " << content.images.size() << " images"
             << std::endl;

  return content;
}

void PdfPageReader::readText(int pageNumber, PageContent &content) {
  // No output file, reading order (not physical layout)
  TextOutputDev textDev(nullptr, false, 0, false, false);
  if (!textDev.isOk()) {
    throw std::runtime_error("Failed to create text output device");
  }

  m_doc.displayPage(&textDev, pageNumber, kPointsDpi, kPointsDpi,
                    0,      // rotation
                    false,  // useMediaBox
                    true,   // crop
                    false); // printing

  std::unique_ptr<TextPage, TextPageRelease> text(textDev.takeText());
  if (!text) {
    return;
  }

  for (const TextFlow *flow = text->getFlows(); flow; flow = flow->getNext()) {
    for (const ::TextBlock *blk = flow->getBlocks(); blk;
         blk = blk->getNext()) {
      RawBlock block;
      block.kind = BlockKind::Text;

      double xMin, yMin, xMax, yMax;
      blk->getBBox(&xMin, &yMin, &xMax, &yMax);
      block.hasBBox = std::isfinite(xMin) && std::isfinite(yMin) &&
                      std::isfinite(xMax) && std::isfinite(yMax) &&
                      xMin <= xMax && yMin <= yMax;
      if (block.hasBBox) {
        block.bbox = Rect(xMin, yMin, xMax, yMax);
      }

      for (const ::TextLine *line = blk->getLines(); line;
           line = line->getNext()) {
        TextLine converted = convertLine(line);
        if (!converted.spans.empty()) {
          block.lines.push_back(std::move(converted));
        }
      }

      content.blocks.push_back(std::move(block));
    }
  }
}

void PdfPageReader::readImages(int pageNumber, PageContent &content) {
  ImageCollectorOutputDev imageDev(content);
  m_doc.displayPage(&imageDev, pageNumber, kPointsDpi, kPointsDpi,
                    0,      // rotation
                    false,  // useMediaBox
                    true,   // crop
                    false); // printing
}

} // namespace a11y
