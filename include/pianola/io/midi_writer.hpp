#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/timebase.hpp"

namespace pianola::io {

// SMF format 1: a tempo track plus one piano track carrying the timeline on
// channel 0, at the source file's resolution.
std::vector<uint8_t> EncodeMergedMidi(const std::vector<pianola::core::NoteEvent>& timeline,
                                      const pianola::core::Timing& timing);

bool WriteMergedMidi(const std::filesystem::path& path, const std::vector<pianola::core::NoteEvent>& timeline,
                     const pianola::core::Timing& timing, std::string* error);

}  // namespace pianola::io
