#include "pianola/core/selection.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pianola::core {
namespace {

constexpr int kMaxChannel = 15;
constexpr int kMinShift = std::numeric_limits<int8_t>::min();
constexpr int kMaxShift = std::numeric_limits<int8_t>::max();

bool Fail(const std::string& text, const std::string& reason, std::string* error) {
  if (error != nullptr) {
    *error = "malformed track selector \"" + text + "\": " + reason;
  }
  return false;
}

}  // namespace

bool ParseSelector(const std::string& text, PartSelector* selector, std::string* error) {
  static const std::regex kPattern(R"(^(\d+),(\d+)([+-]\d+)?$)");
  if (text.find(',') == std::string::npos) {
    return Fail(text, "expected a ','", error);
  }
  std::smatch match;
  if (!std::regex_match(text, match, kPattern)) {
    return Fail(text, "expected track,channel[+shift|-shift]", error);
  }

  PartSelector parsed;
  try {
    parsed.part.track = std::stoi(match[1].str());
  } catch (const std::out_of_range&) {
    return Fail(text, "bad track number: out of range", error);
  }
  try {
    parsed.part.channel = std::stoi(match[2].str());
  } catch (const std::out_of_range&) {
    return Fail(text, "bad channel number: out of range", error);
  }
  if (parsed.part.channel > kMaxChannel) {
    return Fail(text, "bad channel number: must be in [0,15]", error);
  }
  if (match[3].matched) {
    try {
      parsed.shift = std::stoi(match[3].str());
    } catch (const std::out_of_range&) {
      return Fail(text, "bad offset number: out of range", error);
    }
    if (parsed.shift < kMinShift || parsed.shift > kMaxShift) {
      return Fail(text, "bad offset number: must be in [-128,127]", error);
    }
  }
  *selector = parsed;
  return true;
}

bool ParseDivisor(const std::string& text, double* divisor, std::string* error) {
  static const std::regex kPattern(R"(^/((?:\d+\.\d*)|(?:\d+)|(?:\.\d+))$)");
  std::smatch match;
  if (!std::regex_match(text, match, kPattern)) {
    if (error != nullptr) {
      *error = "time divisor parse error: \"" + text + "\" is not /<number>";
    }
    return false;
  }
  double value = 0.0;
  try {
    value = std::stod(match[1].str());
  } catch (const std::out_of_range&) {
    value = 0.0;
  }
  if (!std::isfinite(value) || value <= 0.0) {
    if (error != nullptr) {
      *error = "time divisor parse error: divisor must be a positive number";
    }
    return false;
  }
  *divisor = value;
  return true;
}

std::string FormatSelector(const PartSelector& selector) {
  std::string out = std::to_string(selector.part.track) + "," + std::to_string(selector.part.channel);
  if (selector.shift > 0) {
    out += "+" + std::to_string(selector.shift);
  } else if (selector.shift < 0) {
    out += std::to_string(selector.shift);
  }
  return out;
}

SelectionResult SelectParts(const Song& song, const std::vector<PartSelector>& selectors) {
  SelectionResult result;
  for (const auto& selector : selectors) {
    if (FindPart(song, selector.part) == nullptr) {
      result.errors.push_back("track " + std::to_string(selector.part.track) + " channel " +
                              std::to_string(selector.part.channel) + " has no notes or program in this file (" +
                              FormatSelector(selector) + ")");
    }
  }
  if (!result.errors.empty()) {
    return result;
  }

  result.streams.reserve(selectors.size());
  for (const auto& selector : selectors) {
    PartStream stream;
    stream.selector = selector;
    for (const auto& event : song.events) {
      if (event.part != selector.part) {
        continue;
      }
      NoteEvent shifted = event;
      shifted.pitch += selector.shift;
      stream.events.push_back(shifted);
    }
    result.streams.push_back(std::move(stream));
  }
  result.ok = true;
  return result;
}

}  // namespace pianola::core
