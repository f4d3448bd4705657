#pragma once

// Builders for note events, part streams and raw Standard MIDI File bytes.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/selection.hpp"

namespace pianola::test {

inline core::NoteEvent Press(core::PartId part, int pitch, uint64_t tick, uint8_t velocity = 100) {
  core::NoteEvent event;
  event.part = part;
  event.pitch = pitch;
  event.action = core::NoteAction::kPress;
  event.tick = tick;
  event.velocity = velocity;
  return event;
}

inline core::NoteEvent Release(core::PartId part, int pitch, uint64_t tick) {
  core::NoteEvent event;
  event.part = part;
  event.pitch = pitch;
  event.action = core::NoteAction::kRelease;
  event.tick = tick;
  return event;
}

inline core::PartStream Stream(core::PartId part, std::vector<core::NoteEvent> events) {
  core::PartStream stream;
  stream.selector.part = part;
  stream.events = std::move(events);
  return stream;
}

// Assembles one MTrk chunk from (delta, bytes) pairs. End of track is appended.
class TrackBuilder {
 public:
  TrackBuilder& Event(uint32_t delta, std::vector<uint8_t> bytes) {
    AppendVarLen(delta);
    data_.insert(data_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  TrackBuilder& Raw(std::vector<uint8_t> bytes) {
    data_.insert(data_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  TrackBuilder& NoteOn(uint32_t delta, int channel, int pitch, int velocity = 100) {
    return Event(delta, {static_cast<uint8_t>(0x90 | channel), static_cast<uint8_t>(pitch),
                         static_cast<uint8_t>(velocity)});
  }

  TrackBuilder& NoteOff(uint32_t delta, int channel, int pitch) {
    return Event(delta, {static_cast<uint8_t>(0x80 | channel), static_cast<uint8_t>(pitch), 0x40});
  }

  TrackBuilder& Program(uint32_t delta, int channel, int program) {
    return Event(delta, {static_cast<uint8_t>(0xC0 | channel), static_cast<uint8_t>(program)});
  }

  TrackBuilder& Bank(uint32_t delta, int channel, int bank) {
    return Event(delta, {static_cast<uint8_t>(0xB0 | channel), 0x00, static_cast<uint8_t>(bank)});
  }

  TrackBuilder& Tempo(uint32_t delta, uint32_t micros) {
    return Event(delta, {0xFF, 0x51, 0x03, static_cast<uint8_t>((micros >> 16) & 0xFF),
                         static_cast<uint8_t>((micros >> 8) & 0xFF), static_cast<uint8_t>(micros & 0xFF)});
  }

  TrackBuilder& Meta(uint32_t delta, uint8_t type, const std::string& text) {
    std::vector<uint8_t> bytes = {0xFF, type, static_cast<uint8_t>(text.size())};
    bytes.insert(bytes.end(), text.begin(), text.end());
    return Event(delta, std::move(bytes));
  }

  std::vector<uint8_t> Build(bool end_of_track = true) const {
    std::vector<uint8_t> body = data_;
    if (end_of_track) {
      body.insert(body.end(), {0x00, 0xFF, 0x2F, 0x00});
    }
    std::vector<uint8_t> chunk = {'M', 'T', 'r', 'k'};
    AppendU32(&chunk, static_cast<uint32_t>(body.size()));
    chunk.insert(chunk.end(), body.begin(), body.end());
    return chunk;
  }

  static void AppendU32(std::vector<uint8_t>* out, uint32_t v) {
    out->push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out->push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out->push_back(static_cast<uint8_t>(v & 0xFF));
  }

 private:
  void AppendVarLen(uint32_t value) {
    uint8_t bytes[5];
    int count = 0;
    bytes[count++] = static_cast<uint8_t>(value & 0x7F);
    while ((value >>= 7U) != 0U) {
      bytes[count++] = static_cast<uint8_t>((value & 0x7F) | 0x80U);
    }
    for (int i = count - 1; i >= 0; --i) {
      data_.push_back(bytes[i]);
    }
  }

  std::vector<uint8_t> data_;
};

inline std::vector<uint8_t> BuildSmf(uint16_t format, uint16_t division, const std::vector<TrackBuilder>& tracks) {
  std::vector<uint8_t> out = {'M', 'T', 'h', 'd', 0, 0, 0, 6};
  out.push_back(static_cast<uint8_t>(format >> 8));
  out.push_back(static_cast<uint8_t>(format & 0xFF));
  out.push_back(static_cast<uint8_t>(tracks.size() >> 8));
  out.push_back(static_cast<uint8_t>(tracks.size() & 0xFF));
  out.push_back(static_cast<uint8_t>(division >> 8));
  out.push_back(static_cast<uint8_t>(division & 0xFF));
  for (const auto& track : tracks) {
    const std::vector<uint8_t> chunk = track.Build();
    out.insert(out.end(), chunk.begin(), chunk.end());
  }
  return out;
}

}  // namespace pianola::test
