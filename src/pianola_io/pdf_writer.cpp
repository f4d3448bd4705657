#include "pianola/io/pdf_writer.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

#include "pianola/core/note.hpp"
#include "pianola/io/atomic_file.hpp"

namespace pianola::io {
namespace {

constexpr double kPointsPerInch = 72.0;
constexpr double kMinimumRollLength = 1.0;
constexpr double kMinimumHoleHeight = 0.5;

struct PageSize {
  double width = 0.0;
  double height = 0.0;
};

PageSize PageSizeInPoints(const pianola::core::RollLayout& layout, const PdfPageOptions& options) {
  PageSize size;
  size.width = (layout.width + 2.0 * options.margin) * kPointsPerInch;
  size.height = (std::max(layout.total_length, kMinimumRollLength) + 2.0 * options.margin) * kPointsPerInch;
  return size;
}

std::ostringstream MakeStream() {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(2);
  return out;
}

void AppendText(std::vector<uint8_t>* out, const std::string& text) {
  out->insert(out->end(), text.begin(), text.end());
}

bool BuildZlibDeflate(const std::string& raw, int compression_level, std::vector<uint8_t>* out, std::string* error) {
  if (out == nullptr) {
    if (error != nullptr) {
      *error = "Internal PDF error: null zlib output.";
    }
    return false;
  }
  if (compression_level < 0 || compression_level > 9) {
    if (error != nullptr) {
      *error = "PDF compression level must be in [0,9].";
    }
    return false;
  }
  const uLongf bound = compressBound(static_cast<uLong>(raw.size()));
  out->assign(static_cast<size_t>(bound), 0U);
  uLongf actual = bound;
  const int rc = compress2(out->data(), &actual, reinterpret_cast<const Bytef*>(raw.data()),
                           static_cast<uLong>(raw.size()), compression_level);
  if (rc != Z_OK) {
    if (error != nullptr) {
      *error = "Failed to deflate PDF content stream.";
    }
    return false;
  }
  out->resize(static_cast<size_t>(actual));
  return true;
}

}  // namespace

std::string BuildRollContent(const pianola::core::RollLayout& layout, const PdfPageOptions& options) {
  const PageSize page = PageSizeInPoints(layout, options);
  const double left = options.margin * kPointsPerInch;
  const double top = page.height - options.margin * kPointsPerInch;
  const double hole_pitch = pianola::core::kRollRowCount > 0
                                ? layout.width / static_cast<double>(pianola::core::kRollRowCount) * kPointsPerInch
                                : 0.0;
  const double hole_width = hole_pitch * options.hole_fill;

  std::ostringstream out = MakeStream();
  if (options.octave_guides) {
    out << "0.8 G 0.25 w\n";
    const double bottom = options.margin * kPointsPerInch;
    for (int row = 0; row < pianola::core::kRollRowCount; row += 12) {
      const double x = left + static_cast<double>(row) * hole_pitch + hole_width / 2.0;
      out << x << " " << bottom << " m " << x << " " << top << " l S\n";
    }
  }

  out << "0 g\n";
  for (const auto& segment : layout.segments) {
    const double x = left + segment.x * kPointsPerInch;
    const double height = std::max((segment.end_y - segment.start_y) * kPointsPerInch, kMinimumHoleHeight);
    const double y = top - segment.start_y * kPointsPerInch - height;
    out << x << " " << y << " " << hole_width << " " << height << " re f\n";
  }
  return out.str();
}

bool EncodeRollPdf(const pianola::core::RollLayout& layout, const PdfPageOptions& options, std::vector<uint8_t>* pdf,
                   std::string* error) {
  if (pdf == nullptr) {
    if (error != nullptr) {
      *error = "Internal PDF error: null output.";
    }
    return false;
  }
  if (options.margin < 0.0 || options.hole_fill <= 0.0 || options.hole_fill > 1.0) {
    if (error != nullptr) {
      *error = "Invalid PDF page options.";
    }
    return false;
  }

  std::vector<uint8_t> content;
  if (!BuildZlibDeflate(BuildRollContent(layout, options), options.compression_level, &content, error)) {
    return false;
  }

  const PageSize page = PageSizeInPoints(layout, options);
  std::vector<uint8_t> out;
  std::vector<size_t> offsets;
  AppendText(&out, "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n");

  offsets.push_back(out.size());
  AppendText(&out, "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n");

  offsets.push_back(out.size());
  AppendText(&out, "2 0 obj\n<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n");

  offsets.push_back(out.size());
  {
    std::ostringstream obj = MakeStream();
    obj << "3 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " << page.width << " " << page.height
        << "] /Contents 4 0 R /Resources << >> >>\nendobj\n";
    AppendText(&out, obj.str());
  }

  offsets.push_back(out.size());
  AppendText(&out, "4 0 obj\n<< /Length " + std::to_string(content.size()) + " /Filter /FlateDecode >>\nstream\n");
  out.insert(out.end(), content.begin(), content.end());
  AppendText(&out, "\nendstream\nendobj\n");

  const size_t xref_offset = out.size();
  std::ostringstream xref;
  xref << "xref\n0 " << offsets.size() + 1 << "\n0000000000 65535 f \n";
  for (const size_t offset : offsets) {
    xref << std::setw(10) << std::setfill('0') << offset << " 00000 n \n";
  }
  xref << "trailer\n<< /Size " << offsets.size() + 1 << " /Root 1 0 R >>\nstartxref\n" << xref_offset << "\n%%EOF\n";
  AppendText(&out, xref.str());

  *pdf = std::move(out);
  return true;
}

bool WriteRollPdf(const std::filesystem::path& path, const pianola::core::RollLayout& layout,
                  const PdfPageOptions& options, std::string* error) {
  std::vector<uint8_t> pdf;
  if (!EncodeRollPdf(layout, options, &pdf, error)) {
    return false;
  }
  return WriteFileAtomically(path, pdf, "PDF", error);
}

}  // namespace pianola::io
