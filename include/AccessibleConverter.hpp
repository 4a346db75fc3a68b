#ifndef A11Y_ACCESSIBLE_CONVERTER_HPP
#define A11Y_ACCESSIBLE_CONVERTER_HPP

#include "PageRewriter.hpp"

#include <string>
#include <vector>

namespace a11y {

/// Suffix appended to the base name of every converted file
extern const char *const kAccessibleSuffix;

/// Smallest and largest accepted grid size / merge threshold
constexpr int kMinTunable = 5;
constexpr int kMaxTunable = 50;

/**
 * @brief Document types recognised by file extension
 */
enum class DocumentType {
  PDF,        ///< Fixed-layout page document, rebuilt page by page
  DOCX,       ///< Word document (flow document, not rebuilt by this tool)
  PPTX,       ///< PowerPoint presentation (not rebuilt by this tool)
  Unsupported ///< Anything else
};

/**
 * @brief Configuration options for a conversion
 */
struct ConverterConfig {
  int gridSize = 20;       ///< Layout grid in points (5-50)
  int mergeThreshold = 30; ///< Merge sensitivity in points (5-50)
  double margin = 3.0;     ///< Outline inset and text offset in points
  std::string fontFamily = "Sans"; ///< Typeface for redrawn text
  ImageAssignment imageAssignment =
      ImageAssignment::FirstAvailable; ///< Image-to-block assignment policy
  bool verbose = false; ///< Write DEBUG progress to stderr
};

/**
 * @brief Per-page summary of a conversion
 */
struct PageSummary {
  int pageNumber = 0;
  int mergedBlocks = 0;  ///< Text blocks after merging
  int blocksDrawn = 0;   ///< Merged blocks redrawn
  int spansDrawn = 0;    ///< Text spans redrawn
  int imageBlocks = 0;   ///< Image blocks framed
  int imagesPlaced = 0;  ///< Image blocks that received a picture
  int imagesSkipped = 0; ///< Pictures that could not be decoded or painted
};

/**
 * @brief Result of converting one document
 */
struct ConversionResult {
  bool success = false;     ///< Whether the output file was written
  std::string errorMessage; ///< Error message if failed
  std::string inputPath;    ///< Document that was converted
  std::string outputPath;   ///< Written file (only valid on success)
  DocumentType type = DocumentType::Unsupported;
  int pageCount = 0;               ///< Pages written
  std::vector<PageSummary> pages;  ///< One entry per page
  double processingTimeMs = 0;     ///< Processing time in milliseconds
};

/**
 * @brief Converts documents into high-contrast accessible copies
 *
 * PDF pages are rebuilt from scratch: the page is erased to white, image
 * blocks are framed and filled, and merged text blocks are outlined and their
 * text redrawn in black with a single sans-serif typeface.
 *
 * Example usage:
 * @code
 * a11y::AccessibleConverter converter;
 * auto result = converter.convertFile("report.pdf");
 * if (!result.success) {
 *     std::cerr << result.errorMessage << std::endl;
 * }
 * @endcode
 */
class AccessibleConverter {
public:
  AccessibleConverter();
  explicit AccessibleConverter(const ConverterConfig &config);

  /**
   * @brief Convert a document, choosing the converter by file extension
   *
   * @param inputPath Document to convert
   * @param outputPath Output file; empty derives it with createOutputFilename()
   * @return ConversionResult; errorMessage is set when success is false
   */
  ConversionResult convertFile(const std::string &inputPath,
                               const std::string &outputPath = "");

  /**
   * @brief Rebuild every page of a PDF into an accessible copy
   *
   * Pages are processed one at a time in document order. The output is
   * written to a temporary file next to the target and renamed into place
   * only after the last page was written, so a failed conversion leaves no
   * output behind. Images that fail to resolve or decode and blocks without
   * a bounding box are skipped; failures to read the input or write the
   * output fail the whole conversion.
   *
   * @param pdfPath PDF to convert
   * @param outputPath Output file; empty derives it with createOutputFilename()
   * @return ConversionResult; errorMessage is set when success is false
   */
  ConversionResult convertPDF(const std::string &pdfPath,
                              const std::string &outputPath = "");

  /**
   * @brief Derive the output file name for a document
   *
   * The output lives in the same directory with the same extension, the base
   * name suffixed with kAccessibleSuffix ("report.pdf" becomes
   * "report-Accessible-Copy.pdf").
   */
  static std::string createOutputFilename(const std::string &inputPath);

  /// Document type from the file extension (case-insensitive)
  static DocumentType detectDocumentType(const std::string &path);

  /// Human-readable name of a document type
  static std::string documentTypeName(DocumentType type);

  /**
   * @brief Check that tunables are within their accepted ranges
   * @param config Configuration to check
   * @param error Receives a description of the first problem found
   * @return true if the configuration is usable
   */
  static bool validateConfig(const ConverterConfig &config,
                             std::string &error);

  /// Reconstruction options derived from the configuration
  RewriteOptions rewriteOptions() const;

  const ConverterConfig &getConfig() const;
  void setConfig(const ConverterConfig &config);

private:
  ConverterConfig m_config;
};

} // namespace a11y

#endif // A11Y_ACCESSIBLE_CONVERTER_HPP
