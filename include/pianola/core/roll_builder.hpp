#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pianola/core/geometry.hpp"
#include "pianola/core/merger.hpp"
#include "pianola/core/range_validator.hpp"
#include "pianola/core/selection.hpp"
#include "pianola/core/song.hpp"

namespace pianola::core {

struct RollBuildOptions {
  // Overrides the fudge window derived from the song's resolution.
  std::optional<uint64_t> fudge_ticks;
  RollConfig roll;
};

struct RollBuildResult {
  bool ok = false;
  std::vector<std::string> errors;
  MergeOptions merge_options;
  SelectionResult selection;
  MergeResult merge;
  RangeResult range;
  RollLayout layout;
};

// select -> merge -> range check -> layout. Only selection and layout
// configuration problems make the result not ok; conflicts and range errors
// are carried alongside the best-effort timeline.
RollBuildResult BuildRoll(const Song& song, const std::vector<PartSelector>& selectors,
                          const RollBuildOptions& options);

}  // namespace pianola::core
