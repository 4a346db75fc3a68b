#include "AccessibleConverter.hpp"
#include "CairoPagePainter.hpp"
#include "Diagnostics.hpp"
#include "PdfPageReader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

// Poppler low-level API
#include <Error.h>
#include <ErrorCodes.h>
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <goo/GooString.h>

namespace a11y {

const char *const kAccessibleSuffix = "-Accessible-Copy";

namespace {

// Route Poppler's own diagnostics through the DEBUG stream
void popplerErrorCallback(ErrorCategory /*category*/, Goffset pos,
                          const char *msg) {
  debugLog() << "DEBUG: Poppler";
  if (pos >= 0) {
    debugLog() << " (" << pos << ")";
  }
  debugLog() << ": " << (msg ? msg : "") << std::endl;
}

std::string lowercaseExtension(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

// Removes the temporary output unless released
class PartialFileGuard {
public:
  explicit PartialFileGuard(const std::string &path) : path(path) {}
  ~PartialFileGuard() {
    if (!released) {
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  }
  void release() { released = true; }

private:
  std::string path;
  bool released = false;
};

} // anonymous namespace

AccessibleConverter::AccessibleConverter() : m_config() {}

AccessibleConverter::AccessibleConverter(const ConverterConfig &config)
    : m_config(config) {}

std::string
AccessibleConverter::createOutputFilename(const std::string &inputPath) {
  std::filesystem::path input(inputPath);
  std::string fileName = input.stem().string() + kAccessibleSuffix +
                         input.extension().string();
  if (!input.has_parent_path()) {
    return fileName;
  }
  return (input.parent_path() / fileName).string();
}

DocumentType AccessibleConverter::detectDocumentType(const std::string &path) {
  std::string ext = lowercaseExtension(path);
  if (ext == ".pdf") {
    return DocumentType::PDF;
  }
  if (ext == ".docx") {
    return DocumentType::DOCX;
  }
  if (ext == ".pptx") {
    return DocumentType::PPTX;
  }
  return DocumentType::Unsupported;
}

std::string AccessibleConverter::documentTypeName(DocumentType type) {
  switch (type) {
  case DocumentType::PDF:
    return "PDF";
  case DocumentType::DOCX:
    return "DOCX";
  case DocumentType::PPTX:
    return "PPTX";
  case DocumentType::Unsupported:
    break;
  }
  return "unsupported";
}

bool AccessibleConverter::validateConfig(const ConverterConfig &config,
                                         std::string &error) {
  if (config.gridSize < kMinTunable || config.gridSize > kMaxTunable) {
    error = "Grid size must be between " + std::to_string(kMinTunable) +
            " and " + std::to_string(kMaxTunable) + " (got " +
            std::to_string(config.gridSize) + ")";
    return false;
  }
  if (config.mergeThreshold < kMinTunable ||
      config.mergeThreshold > kMaxTunable) {
    error = "Merge sensitivity must be between " +
            std::to_string(kMinTunable) + " and " +
            std::to_string(kMaxTunable) + " (got " +
            std::to_string(config.mergeThreshold) + ")";
    return false;
  }
  if (config.margin < 0) {
    error = "Margin must not be negative";
    return false;
  }
  if (config.fontFamily.empty()) {
    error = "Font family must not be empty";
    return false;
  }
  return true;
}

RewriteOptions AccessibleConverter::rewriteOptions() const {
  RewriteOptions options;
  options.gridSize = m_config.gridSize;
  options.mergeThreshold = m_config.mergeThreshold;
  options.margin = m_config.margin;
  options.fontFamily = m_config.fontFamily;
  options.imageAssignment = m_config.imageAssignment;
  return options;
}

const ConverterConfig &AccessibleConverter::getConfig() const {
  return m_config;
}

void AccessibleConverter::setConfig(const ConverterConfig &config) {
  m_config = config;
}

ConversionResult AccessibleConverter::convertFile(const std::string &inputPath,
                                                  const std::string &outputPath) {
  DocumentType type = detectDocumentType(inputPath);

  switch (type) {
  case DocumentType::PDF:
    return convertPDF(inputPath, outputPath);

  case DocumentType::DOCX:
  case DocumentType::PPTX: {
    ConversionResult result;
    result.inputPath = inputPath;
    result.type = type;
    result.errorMessage = documentTypeName(type) +
                          " documents are not rebuilt by this tool; only PDF "
                          "files are supported.";
    return result;
  }

  case DocumentType::Unsupported:
    break;
  }

  ConversionResult result;
  result.inputPath = inputPath;
  std::string ext = lowercaseExtension(inputPath);
  result.errorMessage = "File type " + (ext.empty() ? "(none)" : ext) +
                        " is not supported.";
  return result;
}

ConversionResult AccessibleConverter::convertPDF(const std::string &pdfPath,
                                                 const std::string &outputPath) {
  ConversionResult result;
  result.success = false;
  result.inputPath = pdfPath;
  result.type = DocumentType::PDF;

  auto startTime = std::chrono::high_resolution_clock::now();
  setDebugOutput(m_config.verbose);

  std::string configError;
  if (!validateConfig(m_config, configError)) {
    result.errorMessage = configError;
    return result;
  }

  std::string target =
      outputPath.empty() ? createOutputFilename(pdfPath) : outputPath;

  try {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(pdfPath, ec)) {
      result.errorMessage = "Input file not found: " + pdfPath;
      return result;
    }
    if (std::filesystem::exists(target, ec) &&
        std::filesystem::equivalent(pdfPath, target, ec)) {
      result.errorMessage = "Output would overwrite the input file: " + target;
      return result;
    }

    // Initialize Poppler's global parameters (required for low-level API)
    GlobalParamsIniter globalParamsInit(popplerErrorCallback);

    auto fileName = std::make_unique<GooString>(pdfPath);
    std::unique_ptr<PDFDoc> doc(new PDFDoc(std::move(fileName)));
    if (!doc->isOk()) {
      if (doc->getErrorCode() == errEncrypted) {
        result.errorMessage = "PDF file is password protected: " + pdfPath;
      } else {
        result.errorMessage = "Failed to load PDF file: " + pdfPath +
                              " (error code " +
                              std::to_string(doc->getErrorCode()) + ")";
      }
      return result;
    }
    if (doc->getNumPages() < 1) {
      result.errorMessage = "PDF has no pages: " + pdfPath;
      return result;
    }

    PdfPageReader reader(*doc);
    int pageCount = reader.pageCount();
    RewriteOptions options = rewriteOptions();

    debugLog() << "DEBUG: Converting " << pdfPath << " (" << pageCount
               << " pages) to " << target << std::endl;
    debugLog() << "DEBUG: Grid size " << options.gridSize
               << ", merge threshold " << options.mergeThreshold
               << ", margin " << options.margin << std::endl;

    std::string partialPath = target + ".part";
    PartialFileGuard guard(partialPath);
    {
      CairoPagePainter painter(partialPath);

      // Pages are processed strictly one after another; each page's content
      // is dropped before the next page is read
      for (int pageNumber = 1; pageNumber <= pageCount; pageNumber++) {
        PageContent content = reader.readPage(pageNumber);
        PagePlan plan = rewritePage(content, painter, options);

        PageSummary summary;
        summary.pageNumber = pageNumber;
        summary.mergedBlocks = static_cast<int>(plan.mergedBlocks.size());
        summary.blocksDrawn = plan.textBlocksDrawn;
        summary.spansDrawn = plan.spansDrawn;
        summary.imageBlocks = plan.imageBlockCount;
        summary.imagesPlaced = plan.imagesPlaced;
        summary.imagesSkipped = plan.imageFailures;
        result.pages.push_back(summary);
      }

      painter.finish();
      result.pageCount = painter.pageCount();
    }

    std::filesystem::rename(partialPath, target);
    guard.release();

    result.outputPath = target;
    result.success = true;

  } catch (const std::filesystem::filesystem_error &e) {
    result.errorMessage =
        std::string("Failed to write output file: ") + e.what();
    result.pages.clear();
    result.pageCount = 0;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF conversion failed: ") + e.what();
    result.pages.clear();
    result.pageCount = 0;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace a11y
