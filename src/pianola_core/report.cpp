#include "pianola/core/report.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "pianola/core/instrument.hpp"
#include "pianola/core/note.hpp"

namespace pianola::core {
namespace {

std::string FormatInches(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

std::string FormatFileFormat(const Song& song) {
  switch (song.format) {
    case 0:
      return "single track";
    case 1:
      return "multiple track (" + std::to_string(song.declared_tracks) + ")";
    case 2:
      return "multiple song (" + std::to_string(song.declared_tracks) + ")";
    default:
      return "unknown!";
  }
}

}  // namespace

std::string FormatConflict(const Conflict& conflict) {
  std::ostringstream out;
  if (conflict.kind == ConflictKind::kAlreadyPressed) {
    out << "ERROR: at " << conflict.tick << ", note " << PitchName(conflict.pitch) << " on track "
        << conflict.part.track << " channel " << conflict.part.channel << " already pressed at "
        << conflict.owner_tick << " by " << conflict.owner.track << "," << conflict.owner.channel;
  } else {
    out << "ERROR: at " << conflict.tick << " on track " << conflict.part.track << " channel "
        << conflict.part.channel << ", note " << PitchName(conflict.pitch) << " is not pressed yet";
  }
  return out.str();
}

std::string FormatRangeError(const RangeError& error) {
  std::ostringstream out;
  out << "ERROR: at " << error.tick << ", note " << PitchName(error.pitch) << " on track " << error.part.track
      << " channel " << error.part.channel << " is outside of piano roll range";
  return out.str();
}

std::string FormatRollLength(const RollLayout& layout) {
  return "Roll length: " + FormatInches(layout.total_length) + " inches";
}

std::string FormatLengthWarning(const LengthWarning& warning) {
  return "WARNING: roll length " + FormatInches(warning.total_length) + " inches exceeds page limit of " +
         FormatInches(warning.limit) + " inches";
}

std::vector<std::string> FormatSongSummary(const Song& song) {
  std::vector<std::string> lines;
  lines.push_back("MIDI file format: " + FormatFileFormat(song));
  lines.push_back(std::to_string(song.timing.ticks_per_beat) + " MIDI ticks per metronome beat");
  if (song.tempo_declared && song.timing.tempo_us_per_beat > 0U) {
    lines.push_back("Tempo: " + std::to_string(60000000U / song.timing.tempo_us_per_beat) + " beats per minute");
  }
  for (const auto& track : song.tracks) {
    if (!track.name.empty()) {
      lines.push_back("Track " + std::to_string(track.track) + " Name: " + track.name);
    }
    if (!track.instrument.empty()) {
      lines.push_back("Track " + std::to_string(track.track) + " Instrument: " + track.instrument);
    }
  }
  lines.insert(lines.end(), song.notices.begin(), song.notices.end());
  for (const auto& part : song.parts) {
    const TrackInfo* track = FindTrack(song, part.part.track);
    const std::string instrument =
        PartInstrumentName(part.part.channel, part.program, track != nullptr ? track->instrument : std::string());
    lines.push_back("track " + std::to_string(part.part.track) + ", channel " + std::to_string(part.part.channel) +
                    ": " + instrument + " (" + std::to_string(part.note_count) + " notes)");
  }
  return lines;
}

std::vector<std::string> FormatRollReport(const RollBuildResult& result) {
  std::vector<std::string> lines;
  for (const auto& conflict : result.merge.conflicts) {
    lines.push_back(FormatConflict(conflict));
  }
  for (const auto& error : result.range.errors) {
    lines.push_back(FormatRangeError(error));
  }
  if (!result.ok) {
    return lines;
  }
  if (result.layout.unterminated > 0) {
    lines.push_back("WARNING: " + std::to_string(result.layout.unterminated) + " notes still held at end of song");
  }
  lines.push_back(FormatRollLength(result.layout));
  if (result.layout.length_warning.has_value()) {
    lines.push_back(FormatLengthWarning(result.layout.length_warning.value()));
  }
  return lines;
}

}  // namespace pianola::core
