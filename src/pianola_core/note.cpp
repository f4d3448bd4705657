#include "pianola/core/note.hpp"

#include <array>
#include <optional>
#include <string>

namespace pianola::core {
namespace {

constexpr std::array<const char*, 12> kPitchClassNames = {"C",  "C#", "D",  "D#", "E",  "F",
                                                          "F#", "G",  "G#", "A",  "A#", "B"};

int FloorDiv(int value, int divisor) {
  int q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

}  // namespace

std::string PitchName(int pitch) {
  const int octave_index = FloorDiv(pitch, 12);
  const int pitch_class = pitch - octave_index * 12;
  return std::string(kPitchClassNames[static_cast<size_t>(pitch_class)]) + std::to_string(octave_index - 1);
}

bool InRollRange(int pitch) { return pitch >= kRollLowestPitch && pitch <= kRollHighestPitch; }

std::optional<int> RollRow(int pitch) {
  if (!InRollRange(pitch)) {
    return std::nullopt;
  }
  return pitch - kRollLowestPitch;
}

}  // namespace pianola::core
