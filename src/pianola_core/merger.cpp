#include "pianola/core/merger.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

namespace pianola::core {
namespace {

struct Owner {
  PartId part;
  uint64_t tick = 0;
};

struct KeyBoard {
  std::map<int, Owner> owners;
  // Rejected presses per pitch whose releases are still to come.
  std::map<int, int> pending_releases;
};

void Press(const NoteEvent& event, const MergeOptions& options, KeyBoard* keys, MergeResult* out) {
  const auto it = keys->owners.find(event.pitch);
  if (it == keys->owners.end()) {
    keys->owners.emplace(event.pitch, Owner{event.part, event.tick});
    out->timeline.push_back(event);
    return;
  }

  const Owner& owner = it->second;
  const uint64_t delta = event.tick >= owner.tick ? event.tick - owner.tick : 0U;
  if (owner.part != event.part && delta > options.fudge_ticks) {
    Conflict conflict;
    conflict.kind = ConflictKind::kAlreadyPressed;
    conflict.pitch = event.pitch;
    conflict.tick = event.tick;
    conflict.part = event.part;
    conflict.owner = owner.part;
    conflict.owner_tick = owner.tick;
    out->conflicts.push_back(conflict);
  }
  ++keys->pending_releases[event.pitch];
}

void Release(const NoteEvent& event, KeyBoard* keys, MergeResult* out) {
  const auto it = keys->owners.find(event.pitch);
  if (it != keys->owners.end()) {
    keys->owners.erase(it);
    out->timeline.push_back(event);
    return;
  }

  const auto pending = keys->pending_releases.find(event.pitch);
  if (pending != keys->pending_releases.end() && pending->second > 0) {
    --pending->second;
    return;
  }

  Conflict conflict;
  conflict.kind = ConflictKind::kNotPressed;
  conflict.pitch = event.pitch;
  conflict.tick = event.tick;
  conflict.part = event.part;
  out->conflicts.push_back(conflict);
}

}  // namespace

uint64_t FudgeTicksForResolution(uint16_t ticks_per_beat) { return static_cast<uint64_t>(ticks_per_beat) / 3U; }

MergeOptions MergeOptionsForTiming(const Timing& timing) {
  MergeOptions options;
  options.fudge_ticks = FudgeTicksForResolution(timing.ticks_per_beat);
  return options;
}

std::vector<NoteEvent> MergeStreams(const std::vector<PartStream>& streams) {
  size_t total = 0;
  for (const auto& stream : streams) {
    total += stream.events.size();
  }
  std::vector<NoteEvent> merged;
  merged.reserve(total);
  for (const auto& stream : streams) {
    merged.insert(merged.end(), stream.events.begin(), stream.events.end());
  }
  std::stable_sort(merged.begin(), merged.end(),
                   [](const NoteEvent& a, const NoteEvent& b) { return a.tick < b.tick; });
  return merged;
}

MergeResult ResolveKeyOwnership(const std::vector<NoteEvent>& events, const MergeOptions& options) {
  KeyBoard keys;
  MergeResult result;
  result.timeline.reserve(events.size());
  for (const auto& event : events) {
    if (IsPress(event)) {
      Press(event, options, &keys, &result);
    } else {
      Release(event, &keys, &result);
    }
  }
  return result;
}

MergeResult MergeTimeline(const std::vector<PartStream>& streams, const MergeOptions& options) {
  return ResolveKeyOwnership(MergeStreams(streams), options);
}

}  // namespace pianola::core
