/**
 * @file capo_suggester.cpp
 * @brief Implementation of CapoSuggester and CommonCapoPositions.
 */

#include "instrument/fretted/capo_suggester.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace fretvoice {

namespace {

using PC = PitchClass;

constexpr PC EASY_MAJOR_ROOTS[] = {PC::C, PC::G, PC::D, PC::E, PC::A};
constexpr PC EASY_MINOR_ROOTS[] = {PC::A, PC::E, PC::D};
constexpr PC EASY_DOMINANT7_ROOTS[] = {PC::G, PC::C, PC::D, PC::E, PC::A};
constexpr PC OPEN_MAJOR7_ROOTS[] = {PC::F, PC::C, PC::D, PC::A};

template <size_t N>
bool contains(const PC (&roots)[N], PC root) {
  return std::find(std::begin(roots), std::end(roots), root) != std::end(roots);
}

bool isEasyOpenShape(const Chord& shape) {
  switch (shape.type) {
    case ChordType::Major: return contains(EASY_MAJOR_ROOTS, shape.root);
    case ChordType::Minor: return contains(EASY_MINOR_ROOTS, shape.root);
    case ChordType::Dominant7: return contains(EASY_DOMINANT7_ROOTS, shape.root);
    case ChordType::Minor7: return contains(EASY_MINOR_ROOTS, shape.root);
    default: return false;
  }
}

bool isModerateOpenShape(const Chord& shape) {
  switch (shape.type) {
    case ChordType::Major: return shape.root == PC::F;
    case ChordType::Dominant7: return shape.root == PC::B;
    case ChordType::Major7: return contains(OPEN_MAJOR7_ROOTS, shape.root);
    default: return false;
  }
}

struct MajorTransformation {
  PC chord_root;
  PC shape_root;
  uint8_t capo_fret;
};

// Hard major keys and the open shapes a capo turns them into.
constexpr MajorTransformation MAJOR_TRANSFORMATIONS[] = {
    {PC::F, PC::E, 1},       {PC::F, PC::D, 3},      {PC::F, PC::C, 5},
    {PC::ASharp, PC::A, 1},  {PC::ASharp, PC::G, 3},
    {PC::DSharp, PC::D, 1},  {PC::DSharp, PC::C, 3},
    {PC::GSharp, PC::G, 1},
    {PC::CSharp, PC::C, 1},
    {PC::FSharp, PC::E, 2},
    {PC::B, PC::A, 2},
};

}  // namespace

double chordShapeScore(const Chord& shape) {
  if (isEasyOpenShape(shape)) return CapoShapeScores::kEasyOpen;
  if (isModerateOpenShape(shape)) return CapoShapeScores::kModerateOpen;
  if (shape.type == ChordType::Major || shape.type == ChordType::Minor) {
    return CapoShapeScores::kSimpleBarre;
  }
  return CapoShapeScores::kOther;
}

// ============================================================================
// CapoSuggestion
// ============================================================================

std::vector<std::string> CapoSuggestion::shapeSymbols() const {
  std::vector<std::string> symbols;
  symbols.reserve(shapes.size());
  for (const auto& shape : shapes) symbols.push_back(shape.symbol());
  return symbols;
}

std::string CapoSuggestion::description() const {
  if (capo_fret == 0) return "No capo needed";

  std::string result = "Capo fret " + std::to_string(capo_fret) + ": play ";
  auto symbols = shapeSymbols();
  for (size_t i = 0; i < symbols.size(); ++i) {
    if (i > 0) result += ", ";
    result += symbols[i];
  }
  return result;
}

// ============================================================================
// CapoSuggester
// ============================================================================

CapoSuggester::CapoSuggester(Instrument instrument, uint8_t max_capo_fret)
    : instrument_(std::move(instrument)), max_capo_fret_(max_capo_fret) {}

std::vector<CapoSuggestion> CapoSuggester::suggest(const std::vector<Chord>& chords) const {
  std::vector<CapoSuggestion> suggestions;
  if (chords.empty()) return suggestions;

  suggestions.reserve(max_capo_fret_ + 1);
  for (int capo = 0; capo <= max_capo_fret_; ++capo) {
    CapoSuggestion suggestion;
    suggestion.capo_fret = static_cast<uint8_t>(capo);
    suggestion.original_chords = chords;
    suggestion.shapes.reserve(chords.size());
    for (const auto& chord : chords) {
      suggestion.shapes.push_back(chord.transpose(-capo));
      suggestion.difficulty_score += chordShapeScore(suggestion.shapes.back());
    }
    suggestions.push_back(std::move(suggestion));
  }

  std::stable_sort(suggestions.begin(), suggestions.end(),
                   [](const CapoSuggestion& a, const CapoSuggestion& b) {
                     return a.difficulty_score < b.difficulty_score;
                   });
  return suggestions;
}

std::optional<CapoSuggestion> CapoSuggester::suggestBest(const std::vector<Chord>& chords) const {
  auto suggestions = suggest(chords);
  if (suggestions.empty()) return std::nullopt;
  return suggestions.front();
}

// ============================================================================
// CommonCapoPositions
// ============================================================================

namespace CommonCapoPositions {

std::vector<CapoShape> majorTransformations(PitchClass root) {
  std::vector<CapoShape> shapes;
  for (const auto& entry : MAJOR_TRANSFORMATIONS) {
    if (entry.chord_root == root) shapes.push_back({entry.shape_root, entry.capo_fret});
  }
  return shapes;
}

std::vector<int> forChord(const Chord& chord) {
  std::vector<int> positions;

  if (chord.type == ChordType::Major) {
    auto shapes = majorTransformations(chord.root);
    if (shapes.empty()) return {0};
    for (const auto& shape : shapes) positions.push_back(shape.capo_fret);
  } else if (chord.type == ChordType::Minor) {
    for (PC easy : EASY_MINOR_ROOTS) {
      int distance = semitonesUp(easy, chord.root);
      if (distance > 0) positions.push_back(distance);
    }
  } else {
    for (PC easy : EASY_MAJOR_ROOTS) {
      int distance = semitonesUp(easy, chord.root);
      if (distance > 0) positions.push_back(distance);
    }
  }

  std::sort(positions.begin(), positions.end());
  return positions;
}

}  // namespace CommonCapoPositions

}  // namespace fretvoice
