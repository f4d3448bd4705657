#include "pianola/io/midi_reader.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pianola::io {
namespace {

using pianola::core::NoteAction;
using pianola::core::NoteEvent;
using pianola::core::PartId;
using pianola::core::Song;

constexpr uint8_t kMetaText = 0x01;
constexpr uint8_t kMetaCopyright = 0x02;
constexpr uint8_t kMetaTrackName = 0x03;
constexpr uint8_t kMetaInstrumentName = 0x04;
constexpr uint8_t kMetaMarker = 0x06;
constexpr uint8_t kMetaEndOfTrack = 0x2F;
constexpr uint8_t kMetaTempo = 0x51;
constexpr uint8_t kControlBankSelect = 0x00;

uint16_t ReadU16Be(const uint8_t* p) { return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]); }

uint32_t ReadU32Be(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

struct PartState {
  std::optional<int> bank;
  std::optional<int> program;
  uint64_t note_count = 0;
};

struct SongBuilder {
  Song* song = nullptr;
  std::map<PartId, PartState> parts;
  std::vector<NoteEvent> events;
};

class TrackReader {
 public:
  TrackReader(const uint8_t* data, size_t size, int track, SongBuilder* builder)
      : data_(data), size_(size), track_(track), builder_(builder) {}

  bool Read(std::string* error) {
    pianola::core::TrackInfo info;
    info.track = track_;
    builder_->song->tracks.push_back(info);

    while (cursor_ < size_) {
      uint32_t delta = 0;
      if (!ReadVarLen(&delta)) {
        return Fail("truncated delta time", error);
      }
      tick_ += delta;
      if (cursor_ >= size_) {
        return Fail("event missing after delta time", error);
      }

      uint8_t status = data_[cursor_];
      if (status < 0x80U) {
        if (running_status_ == 0U) {
          return Fail("data byte without running status", error);
        }
        status = running_status_;
      } else {
        ++cursor_;
      }

      if (status == 0xFFU) {
        running_status_ = 0U;
        bool end_of_track = false;
        if (!ReadMeta(&end_of_track, error)) {
          return false;
        }
        if (end_of_track) {
          return true;
        }
        continue;
      }
      if (status == 0xF0U || status == 0xF7U) {
        running_status_ = 0U;
        uint32_t length = 0;
        if (!ReadVarLen(&length) || cursor_ + length > size_) {
          return Fail("truncated SysEx event", error);
        }
        cursor_ += length;
        continue;
      }
      if (status >= 0xF0U) {
        return Fail("unsupported status byte " + std::to_string(status), error);
      }

      running_status_ = status;
      if (!ReadChannelMessage(status, error)) {
        return false;
      }
    }
    return true;
  }

 private:
  bool Fail(const std::string& message, std::string* error) const {
    if (error != nullptr) {
      *error = "track " + std::to_string(track_) + " at byte " + std::to_string(cursor_) + ": " + message;
    }
    return false;
  }

  bool ReadVarLen(uint32_t* value) {
    uint32_t result = 0;
    for (int i = 0; i < 4; ++i) {
      if (cursor_ >= size_) {
        return false;
      }
      const uint8_t byte = data_[cursor_++];
      result = (result << 7U) | static_cast<uint32_t>(byte & 0x7FU);
      if ((byte & 0x80U) == 0U) {
        *value = result;
        return true;
      }
    }
    return false;
  }

  pianola::core::TrackInfo& Info() { return builder_->song->tracks.back(); }

  void Warn(const std::string& message) { builder_->song->warnings.push_back(message); }

  std::string Text(uint32_t length) const {
    return std::string(reinterpret_cast<const char*>(data_ + cursor_), static_cast<size_t>(length));
  }

  bool ReadMeta(bool* end_of_track, std::string* error) {
    if (cursor_ >= size_) {
      return Fail("truncated meta event", error);
    }
    const uint8_t type = data_[cursor_++];
    uint32_t length = 0;
    if (!ReadVarLen(&length) || cursor_ + length > size_) {
      return Fail("truncated meta event", error);
    }

    switch (type) {
      case kMetaTrackName: {
        const std::string name = Text(length);
        if (Info().name.empty()) {
          Info().name = name;
        } else {
          Warn("track " + std::to_string(track_) + " given multiple names: \"" + name + "\"");
        }
        break;
      }
      case kMetaInstrumentName: {
        const std::string name = Text(length);
        if (Info().instrument.empty()) {
          Info().instrument = name;
        } else {
          Warn("track " + std::to_string(track_) + " given multiple instrument names: \"" + name + "\"");
        }
        break;
      }
      case kMetaTempo: {
        if (length != 3U) {
          Warn("track " + std::to_string(track_) + " has a malformed tempo event; ignoring it");
          break;
        }
        const uint32_t micros = (static_cast<uint32_t>(data_[cursor_]) << 16) |
                                (static_cast<uint32_t>(data_[cursor_ + 1]) << 8) |
                                static_cast<uint32_t>(data_[cursor_ + 2]);
        if (micros == 0U) {
          Warn("track " + std::to_string(track_) + " has a zero tempo; ignoring it");
          break;
        }
        if (builder_->song->tempo_declared) {
          Warn("tempo changes are not supported; using new tempo");
        }
        builder_->song->timing.tempo_us_per_beat = micros;
        builder_->song->tempo_declared = true;
        break;
      }
      case kMetaCopyright:
        builder_->song->notices.push_back("Copyright: " + Text(length));
        break;
      case kMetaMarker:
        builder_->song->notices.push_back("Marker: " + Text(length));
        break;
      case kMetaText:
        builder_->song->notices.push_back("Text: " + Text(length));
        break;
      case kMetaEndOfTrack:
        *end_of_track = true;
        break;
      default:
        break;
    }
    cursor_ += length;
    return true;
  }

  bool ReadChannelMessage(uint8_t status, std::string* error) {
    const uint8_t type = status & 0xF0U;
    const int channel = static_cast<int>(status & 0x0FU);
    const size_t data_bytes = (type == 0xC0U || type == 0xD0U) ? 1U : 2U;
    if (cursor_ + data_bytes > size_) {
      return Fail("truncated channel message", error);
    }
    const uint8_t d1 = data_[cursor_];
    const uint8_t d2 = data_bytes > 1U ? data_[cursor_ + 1] : 0U;
    cursor_ += data_bytes;

    const PartId part{track_, channel};
    switch (type) {
      case 0x80U:
        PushNote(part, d1, NoteAction::kRelease, 0U);
        break;
      case 0x90U:
        if (d2 == 0U) {
          PushNote(part, d1, NoteAction::kRelease, 0U);
        } else {
          ++builder_->parts[part].note_count;
          PushNote(part, d1, NoteAction::kPress, d2);
        }
        break;
      case 0xB0U:
        if (d1 == kControlBankSelect) {
          PartState& state = builder_->parts[part];
          if (!state.bank.has_value()) {
            state.bank = d2;
          } else {
            Warn("track " + std::to_string(track_) + " channel " + std::to_string(channel) +
                 " set to another bank (" + std::to_string(d2) + ") mid-song");
          }
        }
        break;
      case 0xC0U: {
        PartState& state = builder_->parts[part];
        if (!state.program.has_value()) {
          state.program = d1;
        } else {
          Warn("track " + std::to_string(track_) + " channel " + std::to_string(channel) +
               " set to another program (" + std::to_string(d1) + ") mid-song");
        }
        break;
      }
      default:
        break;
    }
    return true;
  }

  void PushNote(const PartId& part, uint8_t pitch, NoteAction action, uint8_t velocity) {
    NoteEvent event;
    event.part = part;
    event.pitch = static_cast<int>(pitch & 0x7FU);
    event.action = action;
    event.tick = tick_;
    event.velocity = velocity;
    builder_->events.push_back(event);
  }

  const uint8_t* data_ = nullptr;
  size_t size_ = 0;
  size_t cursor_ = 0;
  int track_ = 0;
  uint64_t tick_ = 0;
  uint8_t running_status_ = 0;
  SongBuilder* builder_ = nullptr;
};

void FinishParts(SongBuilder* builder) {
  Song& song = *builder->song;
  for (const auto& [part, state] : builder->parts) {
    pianola::core::PartInfo info;
    info.part = part;
    info.note_count = state.note_count;
    if (state.bank.has_value()) {
      info.bank = state.bank.value();
    } else {
      song.warnings.push_back("track " + std::to_string(part.track) + " channel " + std::to_string(part.channel) +
                              " has no MIDI bank set");
    }
    if (state.program.has_value()) {
      info.program = state.program.value();
    } else {
      song.warnings.push_back("track " + std::to_string(part.track) + " channel " + std::to_string(part.channel) +
                              " has no MIDI program set");
    }
    song.parts.push_back(info);
  }
}

}  // namespace

bool ParseMidiBytes(const std::vector<uint8_t>& bytes, Song* song, std::string* error) {
  if (song == nullptr) {
    if (error != nullptr) {
      *error = "Internal MIDI error: null song.";
    }
    return false;
  }
  if (bytes.size() < 14U || std::memcmp(bytes.data(), "MThd", 4) != 0) {
    if (error != nullptr) {
      *error = "Not a Standard MIDI File (missing MThd header).";
    }
    return false;
  }
  const uint32_t header_size = ReadU32Be(bytes.data() + 4);
  if (header_size < 6U || 8U + static_cast<size_t>(header_size) > bytes.size()) {
    if (error != nullptr) {
      *error = "Malformed MIDI header chunk.";
    }
    return false;
  }

  Song parsed;
  parsed.format = ReadU16Be(bytes.data() + 8);
  parsed.declared_tracks = ReadU16Be(bytes.data() + 10);
  const uint16_t division = ReadU16Be(bytes.data() + 12);
  if ((division & 0x8000U) != 0U) {
    if (error != nullptr) {
      *error = "Unsupported timecode-based MIDI file.";
    }
    return false;
  }
  if (division == 0U) {
    if (error != nullptr) {
      *error = "MIDI file declares zero ticks per beat.";
    }
    return false;
  }
  parsed.timing.ticks_per_beat = division;

  SongBuilder builder;
  builder.song = &parsed;

  int track = 0;
  size_t cursor = 8U + static_cast<size_t>(header_size);
  while (cursor + 8U <= bytes.size()) {
    const uint8_t* chunk_id = bytes.data() + cursor;
    const uint32_t chunk_size = ReadU32Be(bytes.data() + cursor + 4);
    const size_t chunk_data = cursor + 8U;
    if (chunk_data + chunk_size > bytes.size()) {
      if (error != nullptr) {
        *error = "Truncated MIDI chunk at byte " + std::to_string(cursor) + ".";
      }
      return false;
    }
    if (std::memcmp(chunk_id, "MTrk", 4) == 0) {
      TrackReader reader(bytes.data() + chunk_data, chunk_size, track, &builder);
      std::string track_error;
      if (!reader.Read(&track_error)) {
        if (error != nullptr) {
          *error = "Malformed MIDI track: " + track_error;
        }
        return false;
      }
      ++track;
    }
    cursor = chunk_data + chunk_size;
  }
  if (cursor != bytes.size()) {
    parsed.warnings.push_back("ignoring " + std::to_string(bytes.size() - cursor) + " trailing bytes");
  }
  if (track != parsed.declared_tracks) {
    parsed.warnings.push_back("header declares " + std::to_string(parsed.declared_tracks) + " tracks but file has " +
                              std::to_string(track));
  }
  if (!parsed.tempo_declared) {
    parsed.warnings.push_back("no tempo set; assuming 120 beats per minute");
  }

  FinishParts(&builder);
  std::stable_sort(builder.events.begin(), builder.events.end(),
                   [](const NoteEvent& a, const NoteEvent& b) { return a.tick < b.tick; });
  parsed.events = std::move(builder.events);
  *song = std::move(parsed);
  return true;
}

bool ReadMidiFile(const std::filesystem::path& path, Song* song, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error != nullptr) {
      *error = "Failed to open MIDI file: " + path.string();
    }
    return false;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (error != nullptr) {
      *error = "Failed to read MIDI file: " + path.string();
    }
    return false;
  }
  std::string parse_error;
  if (!ParseMidiBytes(bytes, song, &parse_error)) {
    if (error != nullptr) {
      *error = parse_error + " (" + path.string() + ")";
    }
    return false;
  }
  return true;
}

}  // namespace pianola::io
