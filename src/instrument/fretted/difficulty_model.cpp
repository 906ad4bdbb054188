/**
 * @file difficulty_model.cpp
 * @brief Implementation of voicing difficulty scoring.
 */

#include "instrument/fretted/difficulty_model.h"

#include <map>
#include <vector>

namespace fretvoice {

uint8_t calculateFingersRequired(const Voicing& voicing) {
  const auto& positions = voicing.getPositions();

  // fret -> strings fretted there (ascending string order)
  std::map<uint8_t, std::vector<size_t>> strings_by_fret;
  for (size_t i = 0; i < positions.size(); ++i) {
    if (positions[i].isFretted()) {
      strings_by_fret[positions[i].fret()].push_back(i);
    }
  }

  if (strings_by_fret.empty()) return 0;

  auto lowest = strings_by_fret.begin();
  const uint8_t lowest_fret = lowest->first;
  const auto& at_lowest = lowest->second;

  bool can_barre = at_lowest.size() >= 2;
  if (can_barre) {
    for (size_t s = at_lowest.front(); s <= at_lowest.back(); ++s) {
      if (positions[s].isFretted() && positions[s].fret() > lowest_fret) {
        can_barre = false;
        break;
      }
    }
  }

  size_t fingers = can_barre ? 1 : at_lowest.size();
  for (auto it = std::next(lowest); it != strings_by_fret.end(); ++it) {
    fingers += it->second.size();
  }

  return static_cast<uint8_t>(fingers);
}

int calculateDifficultyScore(const Voicing& voicing) {
  using namespace DifficultyWeights;

  int score = 0;

  score += voicing.fretSpan() * kPerFretOfSpan;
  score += voicing.frettedStringCount() * kPerFrettedString;

  if (voicing.requiresBarre()) {
    score += kBarre;
    if (voicing.getBarre()->getStringCount() > kFullBarreStrings) score += kFullBarre;
  }

  auto lowest = voicing.lowestFret();
  if (lowest && *lowest > kHighPositionFret) {
    score += (*lowest - kHighPositionFret) * kPerFretAboveHighPosition;
  }

  score += voicing.interiorMuteCount() * kPerInteriorMute;

  // Open-position bonus
  if (!lowest || *lowest == 1) {
    score += voicing.openStringCount() * kPerOpenString;
  }

  return score < 0 ? 0 : score;
}

VoicingDifficulty categorizeDifficulty(int score) {
  if (score <= DifficultyThresholds::kBeginnerMax) return VoicingDifficulty::Beginner;
  if (score <= DifficultyThresholds::kIntermediateMax) return VoicingDifficulty::Intermediate;
  return VoicingDifficulty::Advanced;
}

}  // namespace fretvoice
