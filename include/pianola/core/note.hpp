#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace pianola::core {

// C1 and G7 with C4 = 60.
constexpr int kRollLowestPitch = 24;
constexpr int kRollHighestPitch = 103;
constexpr int kRollRowCount = kRollHighestPitch - kRollLowestPitch + 1;

struct PartId {
  int track = 0;
  int channel = 0;
};

inline bool operator==(const PartId& a, const PartId& b) { return a.track == b.track && a.channel == b.channel; }
inline bool operator!=(const PartId& a, const PartId& b) { return !(a == b); }
inline bool operator<(const PartId& a, const PartId& b) {
  return std::tie(a.track, a.channel) < std::tie(b.track, b.channel);
}

enum class NoteAction { kPress, kRelease };

struct NoteEvent {
  PartId part;
  int pitch = 60;
  NoteAction action = NoteAction::kPress;
  uint64_t tick = 0;
  uint8_t velocity = 0;
};

inline bool IsPress(const NoteEvent& event) { return event.action == NoteAction::kPress; }

std::string PitchName(int pitch);
std::optional<int> RollRow(int pitch);
bool InRollRange(int pitch);

}  // namespace pianola::core
