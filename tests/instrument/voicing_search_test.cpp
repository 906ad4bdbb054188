/**
 * @file voicing_search_test.cpp
 * @brief Tests for voicing enumeration, filtering, dedup and ordering.
 */

#include "instrument/fretted/voicing_search.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <sstream>

#include "test_support/voicing_test_helpers.h"

namespace fretvoice {
namespace {

using test::chord;
using test::containsVoicing;
using test::indexOfVoicing;
using test::voicing;

// ============================================================================
// Known open shapes
// ============================================================================

TEST(VoicingSearchTest, FindsOpenGuitarShapes) {
  VoicingSearch search(Instruments::guitar());
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("Am")), "X02210"));
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("C")), "X32010"));
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("E")), "022100"));
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("G")), "320003"));
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("D")), "XX0232"));
  EXPECT_TRUE(containsVoicing(search.findVoicings(chord("Em")), "022000"));
}

TEST(VoicingSearchTest, OpenEIsAmongTheEasiest) {
  VoicingSearch search(Instruments::guitar());
  auto easiest = search.findEasiestVoicings(chord("E"), 3);
  EXPECT_TRUE(containsVoicing(easiest, "022100"));
}

// ============================================================================
// Result invariants
// ============================================================================

class VoicingSearchInvariantTest : public ::testing::TestWithParam<const char*> {};

TEST_P(VoicingSearchInvariantTest, EveryResultSatisfiesOptions) {
  auto guitar = Instruments::guitar();
  SearchOptions options;
  VoicingSearch search(guitar, options);
  Chord target = chord(GetParam());

  auto voicings = search.findVoicings(target);
  std::set<std::vector<FretPosition>> shapes;
  int previous_score = -1;

  for (const auto& v : voicings) {
    SCOPED_TRACE(v.toCompactString());
    EXPECT_EQ(v.getStringCount(), guitar.getStringCount());
    EXPECT_TRUE(v.playsChord(target, guitar));
    EXPECT_GE(v.playedStringCount(), options.min_strings_played);
    EXPECT_LE(v.mutedStringCount(), options.max_muted_strings);
    EXPECT_LE(v.fretSpan(), options.max_fret_span);
    EXPECT_LE(v.fingersRequired(), options.max_fingers);

    auto sounding = v.pitchClassesOn(guitar);
    ASSERT_TRUE(sounding.has_value());
    EXPECT_EQ(sounding->front(), target.bass.value_or(target.root));

    for (const auto& pos : v.getPositions()) {
      if (pos.isPlayed()) {
        EXPECT_LE(pos.fret(), options.max_fret);
      }
    }

    EXPECT_TRUE(shapes.insert(v.frettedShape()).second) << "duplicate shape";
    EXPECT_GE(v.difficultyScore(), previous_score);
    previous_score = v.difficultyScore();
  }
}

INSTANTIATE_TEST_SUITE_P(CommonChords, VoicingSearchInvariantTest,
                         ::testing::Values("C", "Am", "G7", "Fmaj7", "Dm7", "Bm7b5", "E9",
                                           "C/G", "Asus2", "Cadd9"));

TEST(VoicingSearchTest, SlashChordPutsBassLowest) {
  VoicingSearch search(Instruments::guitar());
  auto voicings = search.findVoicings(chord("C/G"));
  ASSERT_FALSE(voicings.empty());
  EXPECT_TRUE(containsVoicing(voicings, "332010"));
  for (const auto& v : voicings) {
    EXPECT_EQ(v.pitchClassesOn(Instruments::guitar())->front(), PitchClass::G);
  }
}

TEST(VoicingSearchTest, DeterministicAndDedupIdempotent) {
  VoicingSearch search(Instruments::guitar());
  auto first = search.findVoicings(chord("Am7"));
  auto second = search.findVoicings(chord("Am7"));
  EXPECT_EQ(first, second);
  EXPECT_EQ(VoicingSearch::dedupByShape(first), first);
}

TEST(VoicingSearchTest, EqualScoresKeepGenerationOrder) {
  // Three strings tuned to C: each offers muted, open (C) or fret 7 (G).
  Instrument tres("Three C", {StringConfig(PitchClass::C, 3), StringConfig(PitchClass::C, 3),
                              StringConfig(PitchClass::C, 4)});
  SearchOptions options;
  options.max_fret = 7;
  options.root_in_bass = false;
  options.min_strings_played = 2;
  options.max_muted_strings = 1;

  auto result = VoicingSearch(tres, options).findVoicings(chord("C5"));

  // Dedup slots open in generation order (X07, X70, 077, 7X0, 707, 770) and
  // are filled by the fuller 007, 070 and 700. One fret-7 note scores 11,
  // two score 16.
  std::vector<Voicing> expected = {voicing("007"), voicing("070"), voicing("700"),
                                   voicing("077"), voicing("707"), voicing("770")};
  ASSERT_EQ(result, expected);
  EXPECT_EQ(result[0].difficultyScore(), 11);
  EXPECT_EQ(result[2].difficultyScore(), 11);
  EXPECT_EQ(result[3].difficultyScore(), 16);
  EXPECT_EQ(result[5].difficultyScore(), 16);

  // 077 was generated before 700 but scores higher.
  EXPECT_LT(indexOfVoicing(result, "700"), indexOfVoicing(result, "077"));
}

TEST(VoicingSearchTest, EasiestIsPrefix) {
  VoicingSearch search(Instruments::guitar());
  auto all = search.findVoicings(chord("G"));
  auto easiest = search.findEasiestVoicings(chord("G"), 3);
  ASSERT_EQ(easiest.size(), std::min<size_t>(3, all.size()));
  for (size_t i = 0; i < easiest.size(); ++i) EXPECT_EQ(easiest[i], all[i]);

  EXPECT_TRUE(search.findEasiestVoicings(chord("G"), 0).empty());
}

TEST(VoicingSearchTest, GroupedByLowestFret) {
  VoicingSearch search(Instruments::guitar());
  auto grouped = search.findVoicingsGroupedByPosition(chord("Am"));

  size_t total = 0;
  for (const auto& entry : grouped) {
    for (const auto& v : entry.second) {
      EXPECT_EQ(v.lowestFret().value_or(0), entry.first);
    }
    total += entry.second.size();
  }
  EXPECT_EQ(total, search.findVoicings(chord("Am")).size());
  ASSERT_TRUE(grouped.count(1));
  EXPECT_TRUE(containsVoicing(grouped.at(1), "X02210"));
}

// ============================================================================
// Options
// ============================================================================

TEST(VoicingSearchOptionsTest, BeginnerKeepsOnlyEasyShapes) {
  VoicingSearch search(Instruments::guitar(), SearchOptions::beginner());
  auto am = search.findVoicings(chord("Am"));
  EXPECT_TRUE(containsVoicing(am, "X02210"));
  for (const auto& v : am) {
    EXPECT_EQ(v.difficulty(), VoicingDifficulty::Beginner) << v.toCompactString();
    EXPECT_FALSE(v.hasInteriorMute()) << v.toCompactString();
  }

  // X32010 scores 29
  EXPECT_FALSE(containsVoicing(search.findVoicings(chord("C")), "X32010"));
}

TEST(VoicingSearchOptionsTest, RootNotRequiredInBass) {
  SearchOptions options;
  options.root_in_bass = false;
  VoicingSearch search(Instruments::guitar(), options);
  auto am = search.findVoicings(chord("Am"));

  // 002210 shares the fretted shape of X02210 and plays more strings.
  EXPECT_TRUE(containsVoicing(am, "002210"));
  EXPECT_FALSE(containsVoicing(am, "X02210"));
}

TEST(VoicingSearchOptionsTest, ReentrantUkulele) {
  // The open G string sits below the root.
  VoicingSearch strict(Instruments::ukulele());
  VoicingSearch relaxed(Instruments::ukulele(), SearchOptions::advanced());
  EXPECT_FALSE(containsVoicing(strict.findVoicings(chord("C")), "0003"));
  EXPECT_TRUE(containsVoicing(relaxed.findVoicings(chord("C")), "0003"));
}

TEST(VoicingSearchOptionsTest, FretWindowExcludesOpenStrings) {
  SearchOptions options;
  options.min_fret = 5;
  options.max_fret = 9;
  VoicingSearch search(Instruments::guitar(), options);
  auto voicings = search.findVoicings(chord("A"));
  ASSERT_FALSE(voicings.empty());
  for (const auto& v : voicings) {
    EXPECT_EQ(v.openStringCount(), 0) << v.toCompactString();
    EXPECT_GE(*v.lowestFret(), 5);
    EXPECT_LE(*v.highestFret(), 9);
  }
}

TEST(VoicingSearchOptionsTest, FingerLimit) {
  SearchOptions options;
  options.max_fingers = 2;
  VoicingSearch search(Instruments::guitar(), options);
  for (const auto& v : search.findVoicings(chord("G"))) {
    EXPECT_LE(v.fingersRequired(), 2) << v.toCompactString();
  }
}

TEST(VoicingSearchOptionsTest, DifficultyLimit) {
  SearchOptions options;
  options.max_difficulty = VoicingDifficulty::Intermediate;
  VoicingSearch search(Instruments::guitar(), options);
  for (const auto& v : search.findVoicings(chord("F"))) {
    EXPECT_NE(v.difficulty(), VoicingDifficulty::Advanced) << v.toCompactString();
  }
}

TEST(VoicingSearchOptionsTest, PresetsForLevel) {
  EXPECT_EQ(SearchOptions::forLevel(VoicingDifficulty::Beginner), SearchOptions::beginner());
  EXPECT_EQ(SearchOptions::forLevel(VoicingDifficulty::Advanced), SearchOptions::advanced());
  EXPECT_EQ(SearchOptions::defaults(), SearchOptions());
  EXPECT_FALSE(SearchOptions::advanced().root_in_bass);
  EXPECT_EQ(SearchOptions::intermediate().max_difficulty, VoicingDifficulty::Intermediate);
  EXPECT_FALSE(SearchOptions().max_difficulty.has_value());
}

TEST(VoicingSearchOptionsTest, Validation) {
  EXPECT_EQ(validateSearchOptions(SearchOptions()), SearchOptionsError::OK);
  EXPECT_EQ(validateSearchOptions(SearchOptions::beginner()), SearchOptionsError::OK);
  EXPECT_EQ(validateSearchOptions(SearchOptions::intermediate()), SearchOptionsError::OK);
  EXPECT_EQ(validateSearchOptions(SearchOptions::advanced()), SearchOptionsError::OK);

  SearchOptions window;
  window.min_fret = 7;
  window.max_fret = 5;
  EXPECT_EQ(validateSearchOptions(window), SearchOptionsError::InvalidFretWindow);
  window.min_fret = 0;
  window.max_fret = 25;
  EXPECT_EQ(validateSearchOptions(window), SearchOptionsError::InvalidFretWindow);

  SearchOptions strings;
  strings.min_strings_played = 0;
  EXPECT_EQ(validateSearchOptions(strings), SearchOptionsError::InvalidMinStringsPlayed);

  SearchOptions fingers;
  fingers.max_fingers = 5;
  EXPECT_EQ(validateSearchOptions(fingers), SearchOptionsError::InvalidMaxFingers);
  EXPECT_STREQ(searchOptionsErrorString(SearchOptionsError::InvalidMaxFingers),
               "max_fingers must be 1-4");
}

TEST(VoicingSearchOptionsTest, JsonRoundTrip) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();
  SearchOptions::beginner().writeTo(w);
  w.endObject();

  json::Parser p(oss.str());
  ASSERT_TRUE(p.isValid());
  EXPECT_EQ(p.getString("max_difficulty"), "beginner");

  SearchOptions restored;
  restored.readFrom(p);
  EXPECT_EQ(restored, SearchOptions::beginner());
}

TEST(VoicingSearchOptionsTest, JsonPartialAndNullDifficulty) {
  SearchOptions options = SearchOptions::intermediate();
  options.readFrom(json::Parser(R"({"max_fret": 7, "max_difficulty": null})"));
  EXPECT_EQ(options.max_fret, 7);
  EXPECT_EQ(options.min_strings_played, 4);
  EXPECT_FALSE(options.max_difficulty.has_value());
}

// ============================================================================
// Edge cases
// ============================================================================

TEST(VoicingSearchTest, EmptyInstrumentYieldsNothing) {
  VoicingSearch search(Instrument("Empty", {}));
  EXPECT_TRUE(search.findVoicings(chord("C")).empty());
  EXPECT_TRUE(search.findVoicingsGroupedByPosition(chord("C")).empty());
}

TEST(VoicingSearchTest, CandidatePositionsMutedFirst) {
  VoicingSearch search(Instruments::guitar());
  auto low_e = search.candidatePositions(chord("Am"), 0);
  ASSERT_EQ(low_e.size(), 5u);
  EXPECT_TRUE(low_e[0].isMuted());
  EXPECT_TRUE(low_e[1].isOpen());
  EXPECT_EQ(low_e[2].fret(), 5);
  EXPECT_EQ(low_e[3].fret(), 8);
  EXPECT_EQ(low_e[4].fret(), 12);
}

TEST(VoicingSearchTest, CandidatePositionsRespectCapo) {
  VoicingSearch search(Instruments::ukulele().withCapo(10));
  for (const auto& pos : search.candidatePositions(chord("C"), 0)) {
    if (pos.isPlayed()) {
      EXPECT_LE(pos.fret(), 5);
    }
  }
}

TEST(VoicingSearchTest, DedupPrefersFullerVoicingInFirstSlot) {
  std::vector<Voicing> input = {voicing("X0221X"), voicing("X32010"), voicing("002210")};
  auto result = VoicingSearch::dedupByShape(input);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0], voicing("002210"));
  EXPECT_EQ(result[1], voicing("X32010"));
}

TEST(VoicingSearchTest, DedupKeepsEarlierOnTie) {
  std::vector<Voicing> input = {voicing("X0221X"), voicing("00221X"), voicing("X02210")};
  auto result = VoicingSearch::dedupByShape(input);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0], voicing("00221X"));
}

}  // namespace
}  // namespace fretvoice
