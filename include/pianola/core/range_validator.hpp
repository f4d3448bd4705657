#pragma once

#include <cstdint>
#include <vector>

#include "pianola/core/note.hpp"

namespace pianola::core {

struct RangeError {
  int pitch = 0;
  uint64_t tick = 0;
  PartId part;
};

struct RangeResult {
  std::vector<NoteEvent> timeline;
  std::vector<RangeError> errors;
};

// Keeps events inside [C1, G7]; everything else is reported and dropped.
RangeResult ValidateRange(const std::vector<NoteEvent>& timeline);

}  // namespace pianola::core
