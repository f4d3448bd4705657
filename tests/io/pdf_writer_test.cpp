#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <zlib.h>

#include "pianola/core/geometry.hpp"
#include "pianola/io/pdf_writer.hpp"
#include "test_support/note_helpers.h"

namespace pianola::io {
namespace {

using pianola::core::RollConfig;
using pianola::core::RollLayout;
using pianola::core::Timing;
using pianola::test::Press;
using pianola::test::Release;

RollLayout SampleLayout() {
  Timing timing;
  timing.ticks_per_beat = 96;
  timing.tempo_us_per_beat = 500000;
  RollLayout layout;
  std::string error;
  EXPECT_TRUE(pianola::core::ComputeRollLayout({Press({1, 0}, 60, 0), Press({1, 0}, 67, 48), Release({1, 0}, 60, 96),
                                                Release({1, 0}, 67, 192)},
                                               timing, RollConfig{}, &layout, &error))
      << error;
  return layout;
}

size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

std::string Inflate(const std::string& compressed) {
  std::vector<Bytef> out(1 << 20);
  uLongf size = static_cast<uLongf>(out.size());
  const int rc = uncompress(out.data(), &size, reinterpret_cast<const Bytef*>(compressed.data()),
                            static_cast<uLong>(compressed.size()));
  EXPECT_EQ(rc, Z_OK);
  return std::string(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(size));
}

TEST(PdfWriterTest, ContentDrawsOneRectanglePerSegment) {
  PdfPageOptions options;
  options.octave_guides = false;
  const std::string content = BuildRollContent(SampleLayout(), options);
  EXPECT_EQ(CountOccurrences(content, " re f"), 2u);
}

TEST(PdfWriterTest, OctaveGuidesAreStroked) {
  const std::string content = BuildRollContent(SampleLayout(), PdfPageOptions{});
  EXPECT_EQ(CountOccurrences(content, " l S"), 7u);
}

TEST(PdfWriterTest, EncodesSinglePageWithDeflatedContent) {
  const RollLayout layout = SampleLayout();
  std::vector<uint8_t> pdf;
  std::string error;
  ASSERT_TRUE(EncodeRollPdf(layout, PdfPageOptions{}, &pdf, &error)) << error;

  const std::string text(pdf.begin(), pdf.end());
  EXPECT_EQ(text.rfind("%PDF-1.4", 0), 0u);
  EXPECT_EQ(CountOccurrences(text, "/Type /Page "), 1u);
  EXPECT_NE(text.find("/Filter /FlateDecode"), std::string::npos);
  EXPECT_NE(text.find("startxref"), std::string::npos);
  EXPECT_EQ(text.substr(text.size() - 6), "%%EOF\n");

  const size_t begin = text.find("stream\n") + 7;
  const size_t end = text.find("\nendstream");
  ASSERT_LT(begin, end);
  const std::string content = Inflate(text.substr(begin, end - begin));
  EXPECT_EQ(content, BuildRollContent(layout, PdfPageOptions{}));
}

TEST(PdfWriterTest, PageHeightFollowsRollLength) {
  RollLayout short_roll = SampleLayout();
  RollLayout long_roll = short_roll;
  long_roll.total_length = 150.0;

  std::vector<uint8_t> a;
  std::vector<uint8_t> b;
  std::string error;
  ASSERT_TRUE(EncodeRollPdf(short_roll, PdfPageOptions{}, &a, &error)) << error;
  ASSERT_TRUE(EncodeRollPdf(long_roll, PdfPageOptions{}, &b, &error)) << error;
  const std::string long_text(b.begin(), b.end());
  // (150 + 2 * 0.5) inches at 72 points per inch.
  EXPECT_NE(long_text.find(" 10872.00] "), std::string::npos);
}

TEST(PdfWriterTest, RejectsBadCompressionLevel) {
  PdfPageOptions options;
  options.compression_level = 12;
  std::vector<uint8_t> pdf;
  std::string error;
  EXPECT_FALSE(EncodeRollPdf(SampleLayout(), options, &pdf, &error));
  EXPECT_NE(error.find("compression"), std::string::npos);
}

TEST(PdfWriterTest, WritesFile) {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "pianola_pdf_writer_test";
  std::filesystem::remove_all(dir);
  const std::filesystem::path path = dir / "roll.pdf";
  std::string error;
  ASSERT_TRUE(WriteRollPdf(path, SampleLayout(), PdfPageOptions{}, &error)) << error;
  EXPECT_GT(std::filesystem::file_size(path), 100u);
  std::filesystem::remove_all(dir);
}

}  // namespace
}  // namespace pianola::io
