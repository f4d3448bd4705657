#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pianola/core/geometry.hpp"

namespace pianola::io {

struct PdfPageOptions {
  // Inches around the roll on every side.
  double margin = 0.5;
  // Hole width as a fraction of the hole pitch.
  double hole_fill = 0.6;
  bool octave_guides = true;
  int compression_level = 9;
};

// Uncompressed page content stream (PDF operators, points).
std::string BuildRollContent(const pianola::core::RollLayout& layout, const PdfPageOptions& options);

bool EncodeRollPdf(const pianola::core::RollLayout& layout, const PdfPageOptions& options, std::vector<uint8_t>* pdf,
                   std::string* error);

bool WriteRollPdf(const std::filesystem::path& path, const pianola::core::RollLayout& layout,
                  const PdfPageOptions& options, std::string* error);

}  // namespace pianola::io
