#pragma once

#include <string>
#include <vector>

#include "pianola/core/geometry.hpp"
#include "pianola/core/merger.hpp"
#include "pianola/core/range_validator.hpp"
#include "pianola/core/roll_builder.hpp"
#include "pianola/core/song.hpp"

namespace pianola::core {

std::string FormatConflict(const Conflict& conflict);
std::string FormatRangeError(const RangeError& error);
std::string FormatRollLength(const RollLayout& layout);
std::string FormatLengthWarning(const LengthWarning& warning);

// File header and one line per part with its instrument and note count.
std::vector<std::string> FormatSongSummary(const Song& song);

// Diagnostics in pipeline order: conflicts, range errors, roll length.
std::vector<std::string> FormatRollReport(const RollBuildResult& result);

}  // namespace pianola::core
