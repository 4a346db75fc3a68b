#include "AccessibleConverter.hpp"

#include <cairo-pdf.h>
#include <cairo.h>
#include <poppler-document.h>
#include <poppler-page.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using a11y::AccessibleConverter;
using a11y::DocumentType;

namespace {

// Per-test scratch directory, removed afterwards
class ConverterTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          (std::string("accessible_copy_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  std::string path(const std::string &name) const {
    return (dir / name).string();
  }

  fs::path dir;
};

// Two-page PDF: a heading and a paragraph plus a centered figure on the
// first page, a single line on the second
void writeSamplePdf(const std::string &pdfPath) {
  cairo_surface_t *surface = cairo_pdf_surface_create(pdfPath.c_str(), 600, 800);
  cairo_t *cr = cairo_create(surface);

  cairo_set_source_rgb(cr, 0.2, 0.2, 0.6);
  cairo_paint(cr);

  cairo_set_source_rgb(cr, 1.0, 1.0, 0.0);
  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_BOLD);
  cairo_set_font_size(cr, 18);
  cairo_move_to(cr, 72, 90);
  cairo_show_text(cr, "Hello accessible world");

  cairo_set_font_size(cr, 11);
  cairo_move_to(cr, 72, 130);
  cairo_show_text(cr, "A second line of body text");
  cairo_move_to(cr, 72, 145);
  cairo_show_text(cr, "and a third one below it");

  cairo_surface_t *figure =
      cairo_image_surface_create(CAIRO_FORMAT_RGB24, 64, 48);
  cairo_t *fig = cairo_create(figure);
  cairo_set_source_rgb(fig, 0.9, 0.1, 0.1);
  cairo_paint(fig);
  cairo_destroy(fig);

  cairo_save(cr);
  cairo_translate(cr, 200, 325);
  cairo_scale(cr, 200.0 / 64.0, 150.0 / 48.0);
  cairo_set_source_surface(cr, figure, 0, 0);
  cairo_paint(cr);
  cairo_restore(cr);
  cairo_surface_destroy(figure);

  cairo_show_page(cr);

  cairo_set_source_rgb(cr, 0, 0, 0);
  cairo_set_font_size(cr, 12);
  cairo_move_to(cr, 72, 100);
  cairo_show_text(cr, "Page two");
  cairo_show_page(cr);

  cairo_destroy(cr);
  cairo_surface_finish(surface);
  ASSERT_EQ(cairo_surface_status(surface), CAIRO_STATUS_SUCCESS);
  cairo_surface_destroy(surface);
}

std::string pageText(poppler::document &doc, int index) {
  std::unique_ptr<poppler::page> page(doc.create_page(index));
  if (!page) {
    return std::string();
  }
  poppler::byte_array bytes = page->text().to_utf8();
  return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(OutputNameTest, AppendsAccessibilityMarker) {
  EXPECT_EQ(AccessibleConverter::createOutputFilename("report.pdf"),
            "report-Accessible-Copy.pdf");
  EXPECT_EQ(AccessibleConverter::createOutputFilename("docs/report.PDF"),
            "docs/report-Accessible-Copy.PDF");
  EXPECT_EQ(AccessibleConverter::createOutputFilename("/a/b.c/slides.pptx"),
            "/a/b.c/slides-Accessible-Copy.pptx");
  EXPECT_EQ(AccessibleConverter::createOutputFilename("notes"),
            "notes-Accessible-Copy");
}

TEST(OutputNameTest, NeverEqualsInput) {
  const char *inputs[] = {"a.pdf", "dir/a.docx", "/x/y/z.pptx", "plain"};
  for (const char *input : inputs) {
    EXPECT_NE(AccessibleConverter::createOutputFilename(input), input);
  }
}

TEST(DocumentTypeTest, DetectsByExtensionIgnoringCase) {
  EXPECT_EQ(AccessibleConverter::detectDocumentType("a.pdf"),
            DocumentType::PDF);
  EXPECT_EQ(AccessibleConverter::detectDocumentType("dir/A.PdF"),
            DocumentType::PDF);
  EXPECT_EQ(AccessibleConverter::detectDocumentType("b.DOCX"),
            DocumentType::DOCX);
  EXPECT_EQ(AccessibleConverter::detectDocumentType("c.pptx"),
            DocumentType::PPTX);
  EXPECT_EQ(AccessibleConverter::detectDocumentType("d.txt"),
            DocumentType::Unsupported);
  EXPECT_EQ(AccessibleConverter::detectDocumentType("pdf"),
            DocumentType::Unsupported);
}

TEST(ConfigTest, DefaultsAreValid) {
  a11y::ConverterConfig config;
  std::string error;
  EXPECT_TRUE(AccessibleConverter::validateConfig(config, error));
  EXPECT_EQ(config.gridSize, 20);
  EXPECT_EQ(config.mergeThreshold, 30);
}

TEST(ConfigTest, RejectsOutOfRangeTunables) {
  std::string error;
  a11y::ConverterConfig config;
  config.gridSize = 4;
  EXPECT_FALSE(AccessibleConverter::validateConfig(config, error));
  EXPECT_NE(error.find("Grid size"), std::string::npos);

  config.gridSize = 50;
  config.mergeThreshold = 51;
  EXPECT_FALSE(AccessibleConverter::validateConfig(config, error));
  EXPECT_NE(error.find("Merge sensitivity"), std::string::npos);

  config.mergeThreshold = 5;
  EXPECT_TRUE(AccessibleConverter::validateConfig(config, error));
}

TEST(ConfigTest, RewriteOptionsFollowConfig) {
  a11y::ConverterConfig config;
  config.gridSize = 10;
  config.mergeThreshold = 15;
  config.imageAssignment = a11y::ImageAssignment::AreaOverlap;
  AccessibleConverter converter(config);

  a11y::RewriteOptions options = converter.rewriteOptions();
  EXPECT_DOUBLE_EQ(options.gridSize, 10);
  EXPECT_DOUBLE_EQ(options.mergeThreshold, 15);
  EXPECT_DOUBLE_EQ(options.margin, 3);
  EXPECT_EQ(options.imageAssignment, a11y::ImageAssignment::AreaOverlap);
}

TEST_F(ConverterTest, UnsupportedTypeIsReported) {
  std::string input = path("notes.txt");
  std::ofstream(input) << "plain text";

  AccessibleConverter converter;
  auto result = converter.convertFile(input);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorMessage, "File type .txt is not supported.");
}

TEST_F(ConverterTest, FlowDocumentsAreNotRebuilt) {
  AccessibleConverter converter;
  auto result = converter.convertFile(path("letter.docx"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.type, DocumentType::DOCX);
  EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConverterTest, MissingInputFails) {
  AccessibleConverter converter;
  auto result = converter.convertFile(path("missing.pdf"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.errorMessage.find("not found"), std::string::npos);
  EXPECT_FALSE(fs::exists(path("missing-Accessible-Copy.pdf")));
}

TEST_F(ConverterTest, CorruptInputLeavesNoOutput) {
  std::string input = path("broken.pdf");
  std::ofstream(input) << "this is not a PDF file";

  AccessibleConverter converter;
  auto result = converter.convertFile(input);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
  EXPECT_FALSE(fs::exists(path("broken-Accessible-Copy.pdf")));
  EXPECT_FALSE(fs::exists(path("broken-Accessible-Copy.pdf.part")));
}

TEST_F(ConverterTest, EmptyFileIsReportedAsUnloadable) {
  std::string input = path("empty.pdf");
  std::ofstream(input).close();

  AccessibleConverter converter;
  auto result = converter.convertFile(input);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.errorMessage.find("Failed to load PDF file"),
            std::string::npos);
  EXPECT_EQ(result.pageCount, 0);
  EXPECT_FALSE(fs::exists(path("empty-Accessible-Copy.pdf")));
  EXPECT_FALSE(fs::exists(path("empty-Accessible-Copy.pdf.part")));
}

TEST_F(ConverterTest, UnwritableOutputFails) {
  std::string input = path("sample.pdf");
  writeSamplePdf(input);

  AccessibleConverter converter;
  auto result =
      converter.convertFile(input, path("no_such_dir/sample-out.pdf"));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
  EXPECT_FALSE(fs::exists(path("no_such_dir")));
}

TEST_F(ConverterTest, InvalidConfigIsRejectedBeforeReading) {
  std::string input = path("sample.pdf");
  writeSamplePdf(input);

  a11y::ConverterConfig config;
  config.gridSize = 100;
  AccessibleConverter converter(config);
  auto result = converter.convertFile(input);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(fs::exists(path("sample-Accessible-Copy.pdf")));
}

TEST_F(ConverterTest, ConvertsPdfIntoAccessibleCopy) {
  std::string input = path("sample.pdf");
  writeSamplePdf(input);
  auto inputSize = fs::file_size(input);

  AccessibleConverter converter;
  auto result = converter.convertFile(input);
  ASSERT_TRUE(result.success) << result.errorMessage;

  std::string expected = path("sample-Accessible-Copy.pdf");
  EXPECT_EQ(result.outputPath, expected);
  EXPECT_TRUE(fs::exists(expected));
  EXPECT_FALSE(fs::exists(expected + ".part"));
  EXPECT_EQ(fs::file_size(input), inputSize);

  ASSERT_EQ(result.pageCount, 2);
  ASSERT_EQ(result.pages.size(), 2u);
  EXPECT_EQ(result.pages[0].pageNumber, 1);
  EXPECT_GE(result.pages[0].blocksDrawn, 1);
  EXPECT_GE(result.pages[0].spansDrawn, 3);
  EXPECT_EQ(result.pages[0].imageBlocks, 1);
  EXPECT_EQ(result.pages[0].imagesPlaced, 1);
  EXPECT_EQ(result.pages[1].imageBlocks, 0);
  EXPECT_GE(result.pages[1].spansDrawn, 1);

  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(expected));
  ASSERT_TRUE(doc);
  ASSERT_EQ(doc->pages(), 2);

  std::unique_ptr<poppler::page> first(doc->create_page(0));
  ASSERT_TRUE(first);
  EXPECT_NEAR(first->page_rect().width(), 600, 0.5);
  EXPECT_NEAR(first->page_rect().height(), 800, 0.5);

  EXPECT_NE(pageText(*doc, 0).find("Hello"), std::string::npos);
  EXPECT_NE(pageText(*doc, 0).find("third"), std::string::npos);
  EXPECT_NE(pageText(*doc, 1).find("two"), std::string::npos);
}

TEST_F(ConverterTest, ExplicitOutputPathIsUsed) {
  std::string input = path("sample.pdf");
  writeSamplePdf(input);

  AccessibleConverter converter;
  std::string output = path("custom.pdf");
  auto result = converter.convertPDF(input, output);
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.outputPath, output);
  EXPECT_TRUE(fs::exists(output));
  EXPECT_FALSE(fs::exists(path("sample-Accessible-Copy.pdf")));
}

TEST_F(ConverterTest, RefusesToOverwriteInput) {
  std::string input = path("sample.pdf");
  writeSamplePdf(input);
  auto inputSize = fs::file_size(input);

  AccessibleConverter converter;
  auto result = converter.convertPDF(input, input);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(fs::file_size(input), inputSize);
}
