#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/timebase.hpp"

namespace pianola::core {

// Lengths are in inches.
constexpr double kHolePitch = 1.0 / 9.0;
// "Tempo 70": seven feet of paper per minute.
constexpr double kDefaultRollSpeed = 1.4;
// Largest page a PDF consumer is required to accept.
constexpr double kPageLengthLimit = 200.0;

struct RollConfig {
  double divisor = 1.0;
  double roll_speed = kDefaultRollSpeed;
  double hole_pitch = kHolePitch;
  double length_limit = kPageLengthLimit;
};

struct RollSegment {
  int pitch = 0;
  int row = 0;
  uint64_t start_tick = 0;
  uint64_t end_tick = 0;
  double x = 0.0;
  double start_y = 0.0;
  double end_y = 0.0;
};

struct LengthWarning {
  double total_length = 0.0;
  double limit = 0.0;
};

struct RollLayout {
  std::vector<RollSegment> segments;
  double width = 0.0;
  double total_length = 0.0;
  double length_per_tick = 0.0;
  double divisor = 1.0;
  // Presses still held when the timeline ends.
  int unterminated = 0;
  std::optional<LengthWarning> length_warning;
};

// Paper length covered by one tick at the song's tempo, before compression.
double LengthPerTick(const Timing& timing, double roll_speed);
double LengthPerBeat(const Timing& timing, double roll_speed);

bool ComputeRollLayout(const std::vector<NoteEvent>& timeline, const Timing& timing, const RollConfig& config,
                       RollLayout* layout, std::string* error);

}  // namespace pianola::core
