#pragma once

#include <string>

namespace pianola::core {

constexpr int kPercussionChannel = 9;

// General MIDI level 1 program name for a 0-based program number.
std::string GmProgramName(int program);

std::string PartInstrumentName(int channel, int program, const std::string& track_instrument);

}  // namespace pianola::core
