#include "pianola/core/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace pianola::core {
namespace {

bool Fail(const std::string& message, std::string* error) {
  if (error != nullptr) {
    *error = message;
  }
  return false;
}

double TickToLength(uint64_t tick, double length_per_tick, double divisor) {
  return static_cast<double>(tick) * length_per_tick / divisor;
}

}  // namespace

double LengthPerTick(const Timing& timing, double roll_speed) { return SecondsPerTick(timing) * roll_speed; }

double LengthPerBeat(const Timing& timing, double roll_speed) { return SecondsPerBeat(timing) * roll_speed; }

bool ComputeRollLayout(const std::vector<NoteEvent>& timeline, const Timing& timing, const RollConfig& config,
                       RollLayout* layout, std::string* error) {
  if (layout == nullptr) {
    return Fail("Internal geometry error: null layout.", error);
  }
  if (!std::isfinite(config.divisor) || config.divisor <= 0.0) {
    return Fail("Compression divisor must be greater than zero.", error);
  }
  if (!std::isfinite(config.roll_speed) || config.roll_speed <= 0.0) {
    return Fail("Roll speed must be greater than zero.", error);
  }
  if (timing.ticks_per_beat == 0U) {
    return Fail("Ticks per beat must be greater than zero.", error);
  }

  RollLayout out;
  out.divisor = config.divisor;
  out.length_per_tick = LengthPerTick(timing, config.roll_speed);
  out.width = static_cast<double>(kRollRowCount) * config.hole_pitch;

  std::map<int, uint64_t> open_presses;
  for (const auto& event : timeline) {
    const std::optional<int> row = RollRow(event.pitch);
    if (!row.has_value()) {
      continue;
    }
    if (IsPress(event)) {
      open_presses.emplace(event.pitch, event.tick);
      continue;
    }
    const auto it = open_presses.find(event.pitch);
    if (it == open_presses.end()) {
      continue;
    }
    RollSegment segment;
    segment.pitch = event.pitch;
    segment.row = row.value();
    segment.start_tick = it->second;
    segment.end_tick = event.tick;
    segment.x = static_cast<double>(segment.row) * config.hole_pitch;
    segment.start_y = TickToLength(segment.start_tick, out.length_per_tick, config.divisor);
    segment.end_y = TickToLength(segment.end_tick, out.length_per_tick, config.divisor);
    out.total_length = std::max(out.total_length, segment.end_y);
    out.segments.push_back(segment);
    open_presses.erase(it);
  }
  out.unterminated = static_cast<int>(open_presses.size());

  std::stable_sort(out.segments.begin(), out.segments.end(), [](const RollSegment& a, const RollSegment& b) {
    return std::tie(a.start_tick, a.row) < std::tie(b.start_tick, b.row);
  });

  if (out.total_length > config.length_limit) {
    out.length_warning = LengthWarning{out.total_length, config.length_limit};
  }
  *layout = std::move(out);
  return true;
}

}  // namespace pianola::core
