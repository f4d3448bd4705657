#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "pianola/core/geometry.hpp"
#include "pianola/core/report.hpp"
#include "pianola/core/roll_builder.hpp"
#include "pianola/core/selection.hpp"
#include "pianola/core/song.hpp"
#include "pianola/io/midi_reader.hpp"
#include "pianola/io/midi_writer.hpp"
#include "pianola/io/pdf_writer.hpp"

namespace {

struct CliOptions {
  std::filesystem::path input;
  std::optional<std::filesystem::path> pdf_out;
  std::optional<std::filesystem::path> midi_out;
  std::vector<pianola::core::PartSelector> selectors;
  double divisor = 1.0;
  std::optional<uint64_t> fudge_ticks;
  double roll_speed = pianola::core::kDefaultRollSpeed;
};

void PrintUsage() {
  std::cerr << "Usage:\n";
  std::cerr << "  pianola <file.mid> [-o <out.pdf>] [--midi-out <out.mid>] [--fudge <ticks>]\n";
  std::cerr << "          [--speed <inches/second>] [track,channel[+shift|-shift] ...] [/divisor]\n";
}

bool ParseArgs(int argc, char** argv, CliOptions* options, std::string* error) {
  bool have_input = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-o") {
      if (i + 1 >= argc) {
        *error = "-o must be followed by another argument";
        return false;
      }
      options->pdf_out = std::filesystem::path(argv[++i]);
      continue;
    }
    if (arg == "--midi-out") {
      if (i + 1 >= argc) {
        *error = "Expected value after --midi-out";
        return false;
      }
      options->midi_out = std::filesystem::path(argv[++i]);
      continue;
    }
    if (arg == "--fudge") {
      if (i + 1 >= argc) {
        *error = "Expected value after --fudge";
        return false;
      }
      const std::string value = argv[++i];
      if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        *error = "--fudge expects a non-negative tick count";
        return false;
      }
      try {
        options->fudge_ticks = static_cast<uint64_t>(std::stoull(value));
      } catch (const std::out_of_range&) {
        *error = "--fudge value out of range";
        return false;
      }
      continue;
    }
    if (arg == "--speed") {
      if (i + 1 >= argc) {
        *error = "Expected value after --speed";
        return false;
      }
      try {
        options->roll_speed = std::stod(argv[++i]);
      } catch (const std::exception&) {
        *error = "--speed expects a number of inches per second";
        return false;
      }
      if (!(options->roll_speed > 0.0)) {
        *error = "--speed must be greater than zero";
        return false;
      }
      continue;
    }
    if (!have_input) {
      options->input = std::filesystem::path(arg);
      have_input = true;
      continue;
    }
    if (!arg.empty() && arg[0] == '/') {
      if (!pianola::core::ParseDivisor(arg, &options->divisor, error)) {
        return false;
      }
      continue;
    }
    pianola::core::PartSelector selector;
    if (!pianola::core::ParseSelector(arg, &selector, error)) {
      return false;
    }
    options->selectors.push_back(selector);
  }
  if (!have_input) {
    *error = "missing input argument";
    return false;
  }
  return true;
}

std::filesystem::path DefaultMidiPath(const std::filesystem::path& pdf_path) {
  std::filesystem::path path = pdf_path;
  path.replace_extension(".roll.mid");
  return path;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 2;
  }

  CliOptions options;
  std::string cli_error;
  if (!ParseArgs(argc, argv, &options, &cli_error)) {
    std::cerr << "argument error: " << cli_error << "\n";
    PrintUsage();
    return 2;
  }

  pianola::core::Song song;
  std::string read_error;
  if (!pianola::io::ReadMidiFile(options.input, &song, &read_error)) {
    std::cerr << "MIDI error: " << read_error << "\n";
    return 3;
  }

  for (const auto& warning : song.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  for (const auto& line : pianola::core::FormatSongSummary(song)) {
    std::cout << line << "\n";
  }

  pianola::core::RollBuildOptions build_options;
  build_options.fudge_ticks = options.fudge_ticks;
  build_options.roll.divisor = options.divisor;
  build_options.roll.roll_speed = options.roll_speed;
  const pianola::core::RollBuildResult roll = pianola::core::BuildRoll(song, options.selectors, build_options);
  if (!roll.selection.ok) {
    for (const auto& err : roll.errors) {
      std::cerr << "selection error: " << err << "\n";
    }
    return 4;
  }
  for (const auto& line : pianola::core::FormatRollReport(roll)) {
    std::cout << line << "\n";
  }
  if (!roll.ok) {
    for (const auto& err : roll.errors) {
      std::cerr << "argument error: " << err << "\n";
    }
    return 2;
  }

  std::filesystem::path pdf_path = options.input;
  pdf_path.replace_extension(".pdf");
  if (options.pdf_out.has_value()) {
    pdf_path = options.pdf_out.value();
  }
  const std::filesystem::path midi_path =
      options.midi_out.has_value() ? options.midi_out.value() : DefaultMidiPath(pdf_path);

  {
    std::string error;
    if (!pianola::io::WriteRollPdf(pdf_path, roll.layout, pianola::io::PdfPageOptions{}, &error)) {
      std::cerr << "I/O error: " << error << "\n";
      return 6;
    }
  }

  {
    std::string error;
    if (!pianola::io::WriteMergedMidi(midi_path, roll.range.timeline, song.timing, &error)) {
      std::cerr << "I/O error: " << error << "\n";
      return 6;
    }
  }

  std::cout << "Roll complete\n";
  std::cout << "  parts: " << roll.selection.streams.size() << "\n";
  std::cout << "  conflicts: " << roll.merge.conflicts.size() << "\n";
  std::cout << "  range_errors: " << roll.range.errors.size() << "\n";
  std::cout << "  segments: " << roll.layout.segments.size() << "\n";
  std::cout << "  pdf: " << pdf_path.string() << "\n";
  std::cout << "  midi: " << midi_path.string() << "\n";
  return 0;
}
