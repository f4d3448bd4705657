#include "pianola/io/midi_writer.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "pianola/io/atomic_file.hpp"

namespace pianola::io {
namespace {

constexpr uint8_t kRollChannel = 0;
constexpr uint8_t kPianoProgram = 0;
constexpr char kRollTrackName[] = "Piano roll";

void AppendU16Be(std::vector<uint8_t>* out, uint16_t v) {
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(v & 0xFF));
}

void AppendU32Be(std::vector<uint8_t>* out, uint32_t v) {
  out->push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(v & 0xFF));
}

void WriteVarLen(std::vector<uint8_t>* data, uint32_t value) {
  uint8_t bytes[5];
  int count = 0;
  bytes[count++] = static_cast<uint8_t>(value & 0x7F);
  while ((value >>= 7U) != 0U) {
    bytes[count++] = static_cast<uint8_t>((value & 0x7F) | 0x80U);
  }
  for (int i = count - 1; i >= 0; --i) {
    data->push_back(bytes[i]);
  }
}

struct MidiEvent {
  uint64_t tick = 0;
  std::vector<uint8_t> bytes;
  size_t order = 0;
};

std::vector<uint8_t> EncodeTrack(std::vector<MidiEvent> events, uint64_t end_tick) {
  events.push_back(MidiEvent{end_tick, {0xFF, 0x2F, 0x00}, SIZE_MAX});
  std::stable_sort(events.begin(), events.end(), [](const MidiEvent& a, const MidiEvent& b) {
    if (a.tick == b.tick) {
      return a.order < b.order;
    }
    return a.tick < b.tick;
  });

  std::vector<uint8_t> data;
  uint64_t prev_tick = 0;
  for (const auto& ev : events) {
    const uint64_t delta = ev.tick - prev_tick;
    WriteVarLen(&data, static_cast<uint32_t>(std::min<uint64_t>(delta, 0x0FFFFFFFU)));
    data.insert(data.end(), ev.bytes.begin(), ev.bytes.end());
    prev_tick = ev.tick;
  }
  return data;
}

MidiEvent MakeTempoEvent(uint32_t us_per_quarter) {
  MidiEvent event;
  event.bytes = {0xFF, 0x51, 0x03, static_cast<uint8_t>((us_per_quarter >> 16) & 0xFF),
                 static_cast<uint8_t>((us_per_quarter >> 8) & 0xFF), static_cast<uint8_t>(us_per_quarter & 0xFF)};
  return event;
}

MidiEvent MakeNameEvent(const std::string& name) {
  MidiEvent event;
  const size_t length = std::min<size_t>(127, name.size());
  event.bytes = {0xFF, 0x03, static_cast<uint8_t>(length)};
  for (size_t i = 0; i < length; ++i) {
    event.bytes.push_back(static_cast<uint8_t>(name[i]));
  }
  return event;
}

}  // namespace

std::vector<uint8_t> EncodeMergedMidi(const std::vector<pianola::core::NoteEvent>& timeline,
                                      const pianola::core::Timing& timing) {
  uint64_t end_tick = 0;
  for (const auto& note : timeline) {
    end_tick = std::max(end_tick, note.tick);
  }

  std::vector<std::vector<uint8_t>> encoded_tracks;
  encoded_tracks.push_back(EncodeTrack({MakeTempoEvent(timing.tempo_us_per_beat)}, 0));

  std::vector<MidiEvent> events;
  events.push_back(MakeNameEvent(kRollTrackName));
  events.push_back(MidiEvent{0, {static_cast<uint8_t>(0xB0 | kRollChannel), 0x00, 0x00}, 1});
  events.push_back(MidiEvent{0, {static_cast<uint8_t>(0xC0 | kRollChannel), kPianoProgram}, 2});
  size_t order = 3;
  for (const auto& note : timeline) {
    MidiEvent ev;
    ev.tick = note.tick;
    ev.order = order++;
    const uint8_t key = static_cast<uint8_t>(note.pitch & 0x7F);
    if (pianola::core::IsPress(note)) {
      const uint8_t velocity = note.velocity == 0U ? 0x40U : static_cast<uint8_t>(note.velocity & 0x7F);
      ev.bytes = {static_cast<uint8_t>(0x90 | kRollChannel), key, velocity};
    } else {
      ev.bytes = {static_cast<uint8_t>(0x80 | kRollChannel), key, 0x00};
    }
    events.push_back(std::move(ev));
  }
  encoded_tracks.push_back(EncodeTrack(std::move(events), end_tick));

  std::vector<uint8_t> out;
  out.insert(out.end(), {'M', 'T', 'h', 'd'});
  AppendU32Be(&out, 6);
  AppendU16Be(&out, 1);
  AppendU16Be(&out, static_cast<uint16_t>(encoded_tracks.size()));
  AppendU16Be(&out, timing.ticks_per_beat);
  for (const auto& track_data : encoded_tracks) {
    out.insert(out.end(), {'M', 'T', 'r', 'k'});
    AppendU32Be(&out, static_cast<uint32_t>(track_data.size()));
    out.insert(out.end(), track_data.begin(), track_data.end());
  }
  return out;
}

bool WriteMergedMidi(const std::filesystem::path& path, const std::vector<pianola::core::NoteEvent>& timeline,
                     const pianola::core::Timing& timing, std::string* error) {
  if (timing.ticks_per_beat == 0U || (timing.ticks_per_beat & 0x8000U) != 0U) {
    if (error != nullptr) {
      *error = "Cannot write MIDI with " + std::to_string(timing.ticks_per_beat) + " ticks per beat.";
    }
    return false;
  }
  return WriteFileAtomically(path, EncodeMergedMidi(timeline, timing), "MIDI", error);
}

}  // namespace pianola::io
