#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pianola::io {

// Writes to `<path>.tmp` and renames over `path`, creating parent directories.
bool WriteFileAtomically(const std::filesystem::path& path, const std::vector<uint8_t>& bytes, const std::string& kind,
                         std::string* error);

}  // namespace pianola::io
