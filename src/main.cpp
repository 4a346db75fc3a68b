#include "AccessibleConverter.hpp"

#include <cairo.h>
#include <poppler-version.h>

#include <iomanip>
#include <iostream>
#include <stdexcept>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <document> [options]\n"
      << "\nCreates a high-contrast accessible copy of a PDF document.\n"
      << "\nOptions:\n"
      << "  -g, --grid-size <n>     Layout grid in points, 5-50 (default: 20)\n"
      << "  -m, --merge <n>         Merge sensitivity in points, 5-50 "
         "(default: 30)\n"
      << "  -o, --output <path>     Output file (default: "
         "<name>-Accessible-Copy.<ext>)\n"
      << "      --area-match        Match images to image blocks by overlap\n"
      << "  -v, --verbose           Print debug progress to stderr\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " report.pdf -g 10 -m 15\n";
}

bool parseTunable(const std::string &option, const char *value, int &out) {
  try {
    size_t used = 0;
    out = std::stoi(value, &used);
    if (used != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    return true;
  } catch (const std::exception &) {
    std::cerr << "Error: " << option << " requires an integer, got '" << value
              << "'\n";
    return false;
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string outputPath;
  a11y::ConverterConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-g" || arg == "--grid-size") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --grid-size requires an argument\n";
        return 1;
      }
      if (!parseTunable(arg, argv[++i], config.gridSize)) {
        return 1;
      }
    } else if (arg == "-m" || arg == "--merge") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --merge requires an argument\n";
        return 1;
      }
      if (!parseTunable(arg, argv[++i], config.mergeThreshold)) {
        return 1;
      }
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        outputPath = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg == "--area-match") {
      config.imageAssignment = a11y::ImageAssignment::AreaOverlap;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No document provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::string configError;
  if (!a11y::AccessibleConverter::validateConfig(config, configError)) {
    std::cerr << "Error: " << configError << "\n";
    return 1;
  }

  if (config.verbose) {
    std::cout << "=== Accessible Copy ===\n"
              << "Poppler version: " << POPPLER_VERSION << "\n"
              << "Cairo version: " << cairo_version_string() << "\n"
              << "Grid size: " << config.gridSize << " pt\n"
              << "Merge sensitivity: " << config.mergeThreshold << " pt\n"
              << "=======================\n\n";
  }

  a11y::AccessibleConverter converter(config);
  a11y::ConversionResult result = converter.convertFile(inputPath, outputPath);

  if (!result.success) {
    std::cerr << "Error processing file: " << result.errorMessage << "\n";
    return 1;
  }

  if (config.verbose) {
    std::cout << std::setw(6) << "Page" << std::setw(10) << "Blocks"
              << std::setw(10) << "Drawn" << std::setw(10) << "Spans"
              << std::setw(10) << "Images" << std::setw(10) << "Skipped"
              << "\n";
    std::cout << std::string(56, '-') << "\n";
    for (const auto &page : result.pages) {
      std::cout << std::setw(6) << page.pageNumber << std::setw(10)
                << page.mergedBlocks << std::setw(10) << page.blocksDrawn
                << std::setw(10) << page.spansDrawn << std::setw(10)
                << page.imagesPlaced << std::setw(10) << page.imagesSkipped
                << "\n";
    }
    std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
              << result.processingTimeMs << " ms\n";
  }

  std::cout << "Processed and saved: " << result.outputPath << "\n";
  return 0;
}
