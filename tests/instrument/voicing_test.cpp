/**
 * @file voicing_test.cpp
 * @brief Tests for Voicing structure, parsing and chord membership.
 */

#include "instrument/fretted/voicing.h"

#include <gtest/gtest.h>

#include "test_support/voicing_test_helpers.h"

namespace fretvoice {
namespace {

using test::chord;
using test::voicing;

// ============================================================================
// StringPosition
// ============================================================================

TEST(StringPositionTest, States) {
  EXPECT_TRUE(StringPosition::muted().isMuted());
  EXPECT_FALSE(StringPosition::muted().isPlayed());
  EXPECT_TRUE(StringPosition::open().isOpen());
  EXPECT_TRUE(StringPosition::fretted(3).isFretted());
  EXPECT_EQ(StringPosition::fretted(3).fret(), 3);
}

TEST(StringPositionTest, FretZeroIsOpen) {
  EXPECT_EQ(StringPosition::fretted(0), StringPosition::open());
  EXPECT_EQ(StringPosition::fromFret(0), StringPosition::open());
  EXPECT_EQ(StringPosition::fromFret(-1), StringPosition::muted());
}

TEST(StringPositionTest, FingerIsOptional) {
  EXPECT_FALSE(StringPosition::fretted(2).finger().has_value());
  EXPECT_EQ(StringPosition::fretted(2, 3).finger(), 3);
  EXPECT_FALSE(StringPosition::fretted(2, 7).finger().has_value());
}

// ============================================================================
// Structure
// ============================================================================

TEST(VoicingTest, CountsForAMinor) {
  auto am = Voicing::fromFrets({-1, 0, 2, 2, 1, 0});
  EXPECT_EQ(am.getStringCount(), 6);
  EXPECT_EQ(am.playedStringCount(), 5);
  EXPECT_EQ(am.mutedStringCount(), 1);
  EXPECT_EQ(am.frettedStringCount(), 3);
  EXPECT_EQ(am.openStringCount(), 2);
  EXPECT_EQ(am.lowestFret(), 1);
  EXPECT_EQ(am.highestFret(), 2);
  EXPECT_EQ(am.fretSpan(), 1);
  EXPECT_FALSE(am.requiresBarre());
  EXPECT_FALSE(am.isAllOpen());
}

TEST(VoicingTest, AllOpenHasNoFrets) {
  auto open = Voicing::fromFrets({0, 0, 0, 0, 0, 0});
  EXPECT_TRUE(open.isAllOpen());
  EXPECT_FALSE(open.lowestFret().has_value());
  EXPECT_FALSE(open.highestFret().has_value());
  EXPECT_EQ(open.fretSpan(), 0);
}

TEST(VoicingTest, SingleFrettedNoteHasZeroSpan) {
  auto v = Voicing::fromFrets({-1, -1, 0, 0, 0, 7});
  EXPECT_EQ(v.fretSpan(), 0);
  EXPECT_EQ(v.lowestFret(), 7);
}

TEST(VoicingTest, InteriorMutes) {
  EXPECT_EQ(voicing("X02210").interiorMuteCount(), 0);
  EXPECT_EQ(voicing("XX0232").interiorMuteCount(), 0);
  EXPECT_EQ(voicing("3X0003").interiorMuteCount(), 1);
  EXPECT_EQ(voicing("5X5XX5").interiorMuteCount(), 3);
  EXPECT_TRUE(voicing("3X0003").hasInteriorMute());
  EXPECT_EQ(voicing("XXXXXX").interiorMuteCount(), 0);
}

TEST(VoicingTest, BarreIsCarried) {
  auto f = Voicing::fromFrets({1, 3, 3, 2, 1, 1}, Barre(1, 0, 5));
  ASSERT_TRUE(f.requiresBarre());
  EXPECT_EQ(f.getBarre()->getStringCount(), 6);
  EXPECT_NE(f, Voicing::fromFrets({1, 3, 3, 2, 1, 1}));
}

TEST(VoicingTest, FrettedShapeIgnoresOpenAndMuted) {
  auto shape = voicing("X02210").frettedShape();
  ASSERT_EQ(shape.size(), 3u);
  EXPECT_EQ(shape[0], FretPosition(2, 2));
  EXPECT_EQ(shape[1], FretPosition(3, 2));
  EXPECT_EQ(shape[2], FretPosition(4, 1));

  EXPECT_EQ(voicing("X0221X").frettedShape(), shape);
  EXPECT_TRUE(voicing("000000").frettedShape().empty());
}

TEST(VoicingTest, MoreThan255Strings) {
  std::vector<int> frets(262, 0);
  frets.front() = 2;
  frets.back() = 2;
  auto wide = Voicing::fromFrets(frets);

  EXPECT_EQ(wide.frettedShape().size(), 2u);
  EXPECT_EQ(wide.fingersRequired(), 1);
  // 262 wraps to 6 in a uint8_t; the guitar must still be rejected.
  EXPECT_FALSE(wide.pitchClassesOn(Instruments::guitar()).has_value());
}

// ============================================================================
// Text form
// ============================================================================

TEST(VoicingParseTest, Compact) {
  auto am = parseVoicing("X02210");
  ASSERT_TRUE(am.has_value());
  EXPECT_EQ(*am, Voicing::fromFrets({-1, 0, 2, 2, 1, 0}));

  EXPECT_EQ(parseVoicing("xo221o"), parseVoicing("X02210"));
  EXPECT_EQ(parseVoicing("  X02210 "), parseVoicing("X02210"));
}

TEST(VoicingParseTest, CompactMultiDigit) {
  auto v = parseVoicing("X0(10)(10)90");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, Voicing::fromFrets({-1, 0, 10, 10, 9, 0}));
}

TEST(VoicingParseTest, Delimited) {
  EXPECT_EQ(parseVoicing("X-0-10-10-9-0"), Voicing::fromFrets({-1, 0, 10, 10, 9, 0}));
  EXPECT_EQ(parseVoicing("x 3 2 0 1 0"), Voicing::fromFrets({-1, 3, 2, 0, 1, 0}));
}

TEST(VoicingParseTest, Rejects) {
  EXPECT_FALSE(parseVoicing("").has_value());
  EXPECT_FALSE(parseVoicing("   ").has_value());
  EXPECT_FALSE(parseVoicing("X0221Z").has_value());
  EXPECT_FALSE(parseVoicing("X0(10").has_value());
  EXPECT_FALSE(parseVoicing("X0()0").has_value());
  EXPECT_FALSE(parseVoicing("X--2-2-1-0").has_value());
  EXPECT_FALSE(parseVoicing("0-0-25").has_value());
  EXPECT_FALSE(parseVoicing("000000000").has_value());
}

TEST(VoicingParseTest, CompactStringOutput) {
  EXPECT_EQ(Voicing::fromFrets({-1, 0, 10, 10, 9, 0}).toCompactString(), "X0(10)(10)90");
  EXPECT_EQ(voicing("x32010").toCompactString(), "X32010");
  EXPECT_EQ(voicing(voicing("X0(12)(12)(11)X").toCompactString()),
            voicing("X0(12)(12)(11)X"));
}

// ============================================================================
// Difficulty category names
// ============================================================================

TEST(VoicingDifficultyTest, Names) {
  EXPECT_STREQ(voicingDifficultyToString(VoicingDifficulty::Beginner), "beginner");
  EXPECT_STREQ(voicingDifficultyToString(VoicingDifficulty::Advanced), "advanced");
  EXPECT_EQ(parseVoicingDifficulty("Intermediate"), VoicingDifficulty::Intermediate);
  EXPECT_FALSE(parseVoicingDifficulty("expert").has_value());
}

// ============================================================================
// Sounding pitches
// ============================================================================

TEST(VoicingPitchTest, PitchClassesLowToHigh) {
  auto pcs = voicing("X02210").pitchClassesOn(Instruments::guitar());
  ASSERT_TRUE(pcs.has_value());
  EXPECT_EQ(*pcs, (std::vector<PitchClass>{PitchClass::A, PitchClass::E, PitchClass::A,
                                           PitchClass::C, PitchClass::E}));
}

TEST(VoicingPitchTest, CapoShiftsPitches) {
  auto pcs = voicing("X02210").pitchClassesOn(Instruments::guitar().withCapo(2));
  ASSERT_TRUE(pcs.has_value());
  EXPECT_EQ(pcs->front(), PitchClass::B);
}

TEST(VoicingPitchTest, StringCountMismatch) {
  EXPECT_FALSE(voicing("0003").pitchClassesOn(Instruments::guitar()).has_value());
  EXPECT_FALSE(voicing("0003").playsChord(chord("C"), Instruments::guitar()));
}

TEST(VoicingPitchTest, PlaysChord) {
  auto guitar = Instruments::guitar();
  EXPECT_TRUE(voicing("X02210").playsChord(chord("Am"), guitar));
  EXPECT_TRUE(voicing("X32010").playsChord(chord("C"), guitar));
  EXPECT_FALSE(voicing("X32010").playsChord(chord("Am"), guitar));
  // No seventh
  EXPECT_FALSE(voicing("X3201X").playsChord(chord("C7"), guitar));
  EXPECT_FALSE(voicing("XXXXXX").playsChord(chord("C"), guitar));
}

TEST(VoicingPitchTest, PlaysSlashChordWithForeignBass) {
  // Am/G: G bass is not a tone of Am.
  EXPECT_TRUE(voicing("3X2210").playsChord(chord("Am/G"), Instruments::guitar()));
  EXPECT_FALSE(voicing("3X2210").playsChord(chord("Am"), Instruments::guitar()));
}

TEST(VoicingPitchTest, UkuleleC) {
  EXPECT_TRUE(voicing("0003").playsChord(chord("C"), Instruments::ukulele()));
}

}  // namespace
}  // namespace fretvoice
