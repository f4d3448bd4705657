#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pianola/core/song.hpp"

namespace pianola::io {

bool ReadMidiFile(const std::filesystem::path& path, pianola::core::Song* song, std::string* error);
bool ParseMidiBytes(const std::vector<uint8_t>& bytes, pianola::core::Song* song, std::string* error);

}  // namespace pianola::io
