#pragma once

#include <string>
#include <vector>

#include "pianola/core/note.hpp"
#include "pianola/core/song.hpp"

namespace pianola::core {

// One `track,channel[+shift|-shift]` selector from the command line.
struct PartSelector {
  PartId part;
  int shift = 0;
};

struct PartStream {
  PartSelector selector;
  std::vector<NoteEvent> events;
};

struct SelectionResult {
  bool ok = false;
  std::vector<PartStream> streams;
  std::vector<std::string> errors;
};

bool ParseSelector(const std::string& text, PartSelector* selector, std::string* error);
bool ParseDivisor(const std::string& text, double* divisor, std::string* error);
std::string FormatSelector(const PartSelector& selector);

// Splits the song into one transposed stream per selector, in selector order.
// Every selector naming a part the song does not contain is reported.
SelectionResult SelectParts(const Song& song, const std::vector<PartSelector>& selectors);

}  // namespace pianola::core
