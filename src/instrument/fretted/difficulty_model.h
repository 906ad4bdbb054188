/**
 * @file difficulty_model.h
 * @brief Difficulty scoring and finger-count estimation for voicings.
 *
 * Pure functions over a Voicing. Scores are integers, lower is easier,
 * never negative.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_DIFFICULTY_MODEL_H
#define FRETVOICE_INSTRUMENT_FRETTED_DIFFICULTY_MODEL_H

#include <cstdint>

#include "instrument/fretted/voicing.h"

namespace fretvoice {

/// @brief Difficulty score weights.
namespace DifficultyWeights {
constexpr int kPerFretOfSpan = 10;          ///< Per fret between lowest and highest fretted note
constexpr int kPerFrettedString = 5;        ///< Per fretted string
constexpr int kBarre = 20;                  ///< Barre present
constexpr int kFullBarre = 10;              ///< Extra when the barre covers more than 4 strings
constexpr uint8_t kFullBarreStrings = 4;    ///< Barre string count above which kFullBarre applies
constexpr uint8_t kHighPositionFret = 5;    ///< Position penalty starts above this fret
constexpr int kPerFretAboveHighPosition = 3;
constexpr int kPerInteriorMute = 15;        ///< Per muted string with played strings on both sides
constexpr int kPerOpenString = -3;          ///< Open-position bonus per open string
}  // namespace DifficultyWeights

/// @brief Category thresholds (inclusive upper bounds).
namespace DifficultyThresholds {
constexpr int kBeginnerMax = 25;
constexpr int kIntermediateMax = 50;
}  // namespace DifficultyThresholds

/**
 * @brief Estimate the number of fretting fingers a voicing needs.
 *
 * Fretted strings are grouped by fret. At the lowest fret L, two or more
 * strings count as one finger (a barre) unless a string between the outer
 * strings of that group is fretted above L; otherwise each string at L needs
 * its own finger. Every string fretted above L adds one finger.
 *
 * @return 0 when nothing is fretted
 */
uint8_t calculateFingersRequired(const Voicing& voicing);

/**
 * @brief Calculate the difficulty score of a voicing.
 *
 * +10 per fret of span, +5 per fretted string, +20 for a barre (+10 more
 * above 4 strings), +3 per fret of lowest fret above 5, +15 per interior
 * mute, -3 per open string when the lowest fret is absent or 1. Floored at 0.
 */
int calculateDifficultyScore(const Voicing& voicing);

/// @brief Map a score to a category (<=25 beginner, <=50 intermediate).
VoicingDifficulty categorizeDifficulty(int score);

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_DIFFICULTY_MODEL_H
