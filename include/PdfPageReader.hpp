#ifndef A11Y_PDF_PAGE_READER_HPP
#define A11Y_PDF_PAGE_READER_HPP

#include "PageContent.hpp"

class PDFDoc;

namespace a11y {

/**
 * @brief Reads the structured content of PDF pages with Poppler
 *
 * Text structure (blocks, lines, words) comes from Poppler's TextOutputDev.
 * Image placements and payloads come from a custom OutputDev that records
 * every image drawn on the page. All coordinates are converted to page space
 * with a top-left origin, in points, relative to the crop box.
 *
 * The reader does not own the document, which must outlive it. Poppler's
 * global parameters must be initialised while pages are read.
 */
class PdfPageReader {
public:
  explicit PdfPageReader(PDFDoc &doc);

  PdfPageReader(const PdfPageReader &) = delete;
  PdfPageReader &operator=(const PdfPageReader &) = delete;

  /// Number of pages in the document
  int pageCount() const;

  /**
   * @brief Read one page
   *
   * Images that cannot be decoded are still listed, with an empty payload
   * and a decodeError message.
   *
   * @param pageNumber 1-indexed page number
   * @return Page content description
   * @throws std::runtime_error if the page number is out of range or the
   * text device cannot be created
   */
  PageContent readPage(int pageNumber);

  /**
   * @brief Size of a page as it is displayed (crop box, rotation applied)
   * @param pageNumber 1-indexed page number
   * @return Page rectangle with its top-left corner at (0, 0)
   */
  Rect pageRect(int pageNumber) const;

private:
  void readText(int pageNumber, PageContent &content);
  void readImages(int pageNumber, PageContent &content);

  PDFDoc &m_doc;
};

} // namespace a11y

#endif // A11Y_PDF_PAGE_READER_HPP
