#include "pianola/core/song.hpp"

namespace pianola::core {

const PartInfo* FindPart(const Song& song, const PartId& part) {
  for (const auto& info : song.parts) {
    if (info.part == part) {
      return &info;
    }
  }
  return nullptr;
}

const TrackInfo* FindTrack(const Song& song, int track) {
  for (const auto& info : song.tracks) {
    if (info.track == track) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace pianola::core
