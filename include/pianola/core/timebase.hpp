#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace pianola::core {

constexpr uint32_t kDefaultTempoMicros = 500000;

// Source file timing: metrical division plus a single tempo.
struct Timing {
  uint16_t ticks_per_beat = 480;
  uint32_t tempo_us_per_beat = kDefaultTempoMicros;
};

inline double BpmFromTempo(uint32_t tempo_us_per_beat) {
  if (tempo_us_per_beat == 0U) {
    return 0.0;
  }
  return 60000000.0 / static_cast<double>(tempo_us_per_beat);
}

inline uint32_t TempoFromBpm(double bpm) {
  const double safe_bpm = std::max(1.0, bpm);
  return static_cast<uint32_t>(std::llround(60000000.0 / safe_bpm));
}

inline double SecondsPerBeat(const Timing& timing) { return static_cast<double>(timing.tempo_us_per_beat) / 1000000.0; }

inline double SecondsPerTick(const Timing& timing) {
  if (timing.ticks_per_beat == 0U) {
    return 0.0;
  }
  return SecondsPerBeat(timing) / static_cast<double>(timing.ticks_per_beat);
}

inline double TicksToSeconds(uint64_t ticks, const Timing& timing) {
  return static_cast<double>(ticks) * SecondsPerTick(timing);
}

}  // namespace pianola::core
