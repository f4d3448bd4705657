#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/timebase.hpp"

namespace pianola::core {

struct TrackInfo {
  int track = 0;
  std::string name;
  std::string instrument;
};

struct PartInfo {
  PartId part;
  int bank = 0;
  int program = 0;
  uint64_t note_count = 0;
};

// Decoded performance. `events` is sorted by tick; ties keep file order.
struct Song {
  int format = 1;
  int declared_tracks = 0;
  Timing timing;
  bool tempo_declared = false;
  std::vector<TrackInfo> tracks;
  std::vector<PartInfo> parts;
  std::vector<NoteEvent> events;
  std::vector<std::string> notices;
  std::vector<std::string> warnings;
};

const PartInfo* FindPart(const Song& song, const PartId& part);
const TrackInfo* FindTrack(const Song& song, int track);

}  // namespace pianola::core
