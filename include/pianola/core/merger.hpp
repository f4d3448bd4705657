#pragma once

#include <cstdint>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/selection.hpp"
#include "pianola/core/timebase.hpp"

namespace pianola::core {

struct MergeOptions {
  // Presses on a held key at most this many ticks after the holder's press
  // are treated as the same keystroke and not reported.
  uint64_t fudge_ticks = 0;
};

// A third of a beat.
uint64_t FudgeTicksForResolution(uint16_t ticks_per_beat);
MergeOptions MergeOptionsForTiming(const Timing& timing);

enum class ConflictKind { kAlreadyPressed, kNotPressed };

struct Conflict {
  ConflictKind kind = ConflictKind::kAlreadyPressed;
  int pitch = 0;
  uint64_t tick = 0;
  PartId part;
  // Holder of the key; only set for kAlreadyPressed.
  PartId owner;
  uint64_t owner_tick = 0;
};

struct MergeResult {
  std::vector<NoteEvent> timeline;
  std::vector<Conflict> conflicts;
};

// Stable merge by tick. Ties go to the earlier stream, then to the earlier
// event within a stream.
std::vector<NoteEvent> MergeStreams(const std::vector<PartStream>& streams);

// Folds a tick-ordered event list into a one-holder-per-key timeline.
MergeResult ResolveKeyOwnership(const std::vector<NoteEvent>& events, const MergeOptions& options);

MergeResult MergeTimeline(const std::vector<PartStream>& streams, const MergeOptions& options);

}  // namespace pianola::core
