#include "pianola/io/atomic_file.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace pianola::io {

bool WriteFileAtomically(const std::filesystem::path& path, const std::vector<uint8_t>& bytes, const std::string& kind,
                         std::string* error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error != nullptr) {
        *error = "Failed to create directory for " + kind + ": " + path.parent_path().string();
      }
      return false;
    }
  }

  const std::filesystem::path tmp = path.string() + ".tmp";
  std::ofstream out(tmp, std::ios::binary);
  if (!out.is_open()) {
    if (error != nullptr) {
      *error = "Failed to open " + kind + " for writing: " + tmp.string();
    }
    return false;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out.good()) {
    if (error != nullptr) {
      *error = "Failed while writing " + kind + " bytes: " + tmp.string();
    }
    return false;
  }
  out.close();
  if (!out.good()) {
    if (error != nullptr) {
      *error = "Failed closing " + kind + " file: " + tmp.string();
    }
    return false;
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp, path, ec);
  }
  if (ec) {
    if (error != nullptr) {
      *error = "Failed to finalize " + kind + " file: " + path.string();
    }
    return false;
  }
  return true;
}

}  // namespace pianola::io
