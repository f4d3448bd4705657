#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pianola/core/report.hpp"
#include "pianola/core/roll_builder.hpp"
#include "pianola/io/midi_reader.hpp"
#include "pianola/io/midi_writer.hpp"
#include "pianola/io/pdf_writer.hpp"
#include "test_support/note_helpers.h"

namespace pianola::core {
namespace {

using pianola::test::BuildSmf;
using pianola::test::TrackBuilder;

// Three parts doubling middle C at 96 ticks per beat (fudge window 32):
// strings enter 20 ticks late, flute 50 ticks late.
Song ThreePartSong() {
  TrackBuilder conductor;
  conductor.Meta(0, 0x03, "Conductor").Tempo(0, 500000);

  TrackBuilder piano;
  piano.Meta(0, 0x03, "Piano").Bank(0, 0, 0).Program(0, 0, 0);
  piano.NoteOn(0, 0, 60).NoteOff(96, 0, 60).NoteOn(96, 0, 72).NoteOff(96, 0, 72);

  TrackBuilder strings;
  strings.Bank(0, 1, 0).Program(0, 1, 48);
  strings.NoteOn(20, 1, 60).NoteOff(80, 1, 60);

  TrackBuilder flute;
  flute.Bank(0, 2, 0).Program(0, 2, 73);
  flute.NoteOn(50, 2, 60).NoteOff(100, 2, 60);

  Song song;
  std::string error;
  EXPECT_TRUE(pianola::io::ParseMidiBytes(BuildSmf(1, 96, {conductor, piano, strings, flute}), &song, &error))
      << error;
  return song;
}

std::vector<PartSelector> AllParts() {
  return {PartSelector{{1, 0}, 0}, PartSelector{{2, 1}, 0}, PartSelector{{3, 2}, 0}};
}

TEST(RollBuilderTest, MergesDoubledPartsIntoSingleHolderTimeline) {
  const Song song = ThreePartSong();
  const RollBuildResult roll = BuildRoll(song, AllParts(), RollBuildOptions{});
  ASSERT_TRUE(roll.ok);
  EXPECT_EQ(roll.merge_options.fudge_ticks, 32u);

  ASSERT_EQ(roll.merge.conflicts.size(), 1u);
  const Conflict& conflict = roll.merge.conflicts[0];
  EXPECT_EQ(conflict.kind, ConflictKind::kAlreadyPressed);
  EXPECT_EQ(conflict.tick, 50u);
  EXPECT_EQ(conflict.part, (PartId{3, 2}));
  EXPECT_EQ(conflict.owner, (PartId{1, 0}));
  EXPECT_EQ(FormatConflict(conflict), "ERROR: at 50, note C4 on track 3 channel 2 already pressed at 0 by 1,0");

  const std::vector<NoteEvent>& timeline = roll.range.timeline;
  ASSERT_EQ(timeline.size(), 4u);
  EXPECT_EQ(timeline[0].tick, 0u);
  EXPECT_EQ(timeline[1].tick, 96u);
  EXPECT_EQ(timeline[1].action, NoteAction::kRelease);
  EXPECT_EQ(timeline[2].pitch, 72);
  EXPECT_TRUE(roll.range.errors.empty());

  EXPECT_EQ(roll.layout.segments.size(), 2u);
  EXPECT_GT(roll.layout.total_length, 0.0);
  EXPECT_EQ(roll.layout.unterminated, 0);
}

TEST(RollBuilderTest, ReEmittedMidiContainsOnlyAcceptedEvents) {
  const Song song = ThreePartSong();
  const RollBuildResult roll = BuildRoll(song, AllParts(), RollBuildOptions{});
  ASSERT_TRUE(roll.ok);

  Song merged;
  std::string error;
  ASSERT_TRUE(
      pianola::io::ParseMidiBytes(pianola::io::EncodeMergedMidi(roll.range.timeline, song.timing), &merged, &error))
      << error;
  ASSERT_EQ(merged.events.size(), roll.range.timeline.size());
  for (size_t i = 0; i < merged.events.size(); ++i) {
    EXPECT_EQ(merged.events[i].tick, roll.range.timeline[i].tick) << i;
    EXPECT_EQ(merged.events[i].pitch, roll.range.timeline[i].pitch) << i;
    EXPECT_EQ(merged.events[i].action, roll.range.timeline[i].action) << i;
  }
  EXPECT_EQ(merged.timing.ticks_per_beat, song.timing.ticks_per_beat);

  std::vector<uint8_t> pdf;
  EXPECT_TRUE(pianola::io::EncodeRollPdf(roll.layout, pianola::io::PdfPageOptions{}, &pdf, &error)) << error;
}

TEST(RollBuilderTest, FudgeOverrideIsHonoured) {
  RollBuildOptions options;
  options.fudge_ticks = 10;
  const RollBuildResult roll = BuildRoll(ThreePartSong(), AllParts(), options);
  ASSERT_TRUE(roll.ok);
  EXPECT_EQ(roll.merge_options.fudge_ticks, 10u);
  ASSERT_EQ(roll.merge.conflicts.size(), 2u);
  EXPECT_EQ(roll.merge.conflicts[0].tick, 20u);
  EXPECT_EQ(roll.merge.conflicts[1].tick, 50u);
  EXPECT_EQ(roll.range.timeline.size(), 4u);
}

TEST(RollBuilderTest, UnknownPartFailsBeforeMerging) {
  std::vector<PartSelector> selectors = AllParts();
  selectors.push_back(PartSelector{{4, 3}, 0});
  const RollBuildResult roll = BuildRoll(ThreePartSong(), selectors, RollBuildOptions{});
  EXPECT_FALSE(roll.ok);
  EXPECT_FALSE(roll.selection.ok);
  ASSERT_EQ(roll.errors.size(), 1u);
  EXPECT_NE(roll.errors[0].find("track 4 channel 3"), std::string::npos);
  EXPECT_TRUE(roll.merge.timeline.empty());
}

TEST(RollBuilderTest, TransposedPartOutsideRollIsDropped) {
  const std::vector<PartSelector> selectors = {PartSelector{{1, 0}, 0}, PartSelector{{3, 2}, 48}};
  const RollBuildResult roll = BuildRoll(ThreePartSong(), selectors, RollBuildOptions{});
  ASSERT_TRUE(roll.ok);
  EXPECT_TRUE(roll.merge.conflicts.empty());
  ASSERT_EQ(roll.range.errors.size(), 2u);
  EXPECT_EQ(roll.range.errors[0].pitch, 108);
  EXPECT_EQ(roll.range.errors[0].part, (PartId{3, 2}));
  EXPECT_EQ(roll.range.timeline.size(), 4u);
  for (const auto& event : roll.range.timeline) {
    EXPECT_TRUE(InRollRange(event.pitch));
  }
}

TEST(RollBuilderTest, EmptySelectionGivesEmptyRoll) {
  const RollBuildResult roll = BuildRoll(ThreePartSong(), {}, RollBuildOptions{});
  ASSERT_TRUE(roll.ok);
  EXPECT_TRUE(roll.range.timeline.empty());
  EXPECT_TRUE(roll.layout.segments.empty());
  EXPECT_DOUBLE_EQ(roll.layout.total_length, 0.0);
}

TEST(RollBuilderTest, InvalidDivisorIsReported) {
  RollBuildOptions options;
  options.roll.divisor = 0.0;
  const RollBuildResult roll = BuildRoll(ThreePartSong(), AllParts(), options);
  EXPECT_FALSE(roll.ok);
  EXPECT_TRUE(roll.selection.ok);
  EXPECT_FALSE(roll.errors.empty());
}

}  // namespace
}  // namespace pianola::core
