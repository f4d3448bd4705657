#include "pianola/core/range_validator.hpp"

#include <vector>

namespace pianola::core {

RangeResult ValidateRange(const std::vector<NoteEvent>& timeline) {
  RangeResult result;
  result.timeline.reserve(timeline.size());
  for (const auto& event : timeline) {
    if (InRollRange(event.pitch)) {
      result.timeline.push_back(event);
      continue;
    }
    result.errors.push_back(RangeError{event.pitch, event.tick, event.part});
  }
  return result;
}

}  // namespace pianola::core
