/**
 * @file voicing_sequencer.h
 * @brief Transition cost between voicings and neighbour-aware candidate ranking.
 *
 * Ranking looks only at the immediate neighbours of a chord; it does not
 * search for the cheapest path through a whole progression.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEQUENCER_H
#define FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEQUENCER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "instrument/fretted/voicing.h"

namespace fretvoice {

/// @brief Open versus barre bias when ranking candidates.
enum class VoicingPreference : uint8_t {
  PreferOpen,
  PreferBarre,
  Balanced
};

inline const char* voicingPreferenceToString(VoicingPreference preference) {
  switch (preference) {
    case VoicingPreference::PreferOpen: return "open";
    case VoicingPreference::PreferBarre: return "barre";
    case VoicingPreference::Balanced: return "balanced";
  }
  return "unknown";
}

/// @brief Parse "open" / "barre" / "balanced".
std::optional<VoicingPreference> parseVoicingPreference(const std::string& text);

/// @brief Transition difficulty category.
enum class TransitionDifficulty : uint8_t {
  Easy,    ///< cost < 20
  Medium,  ///< cost 20-50
  Hard     ///< cost > 50
};

inline const char* transitionDifficultyToString(TransitionDifficulty difficulty) {
  switch (difficulty) {
    case TransitionDifficulty::Easy: return "easy";
    case TransitionDifficulty::Medium: return "medium";
    case TransitionDifficulty::Hard: return "hard";
  }
  return "unknown";
}

/// @brief Transition cost weights.
namespace TransitionCostWeights {
constexpr int kPerPositionFret = 10;     ///< Per fret of lowest-fret movement
constexpr int kPerStringFret = 2;        ///< Per fret moved on a string fretted on both sides
constexpr int kFrettedStateChange = 3;   ///< String fretted on exactly one side
constexpr int kBarreChange = 15;         ///< Barre on exactly one side
constexpr int kSimilarShapeBonus = -5;   ///< Span and finger counts within 1
constexpr int kSimilarShapeTolerance = 1;
}  // namespace TransitionCostWeights

/// @brief Ranking weights.
namespace RankingWeights {
constexpr double kPrevious = 0.6;
constexpr double kNext = 0.4;
constexpr int kOpenPreferredBarre = 30;
constexpr int kOpenPreferredOpen = -15;
constexpr int kBarrePreferredBarre = -15;
constexpr int kBarrePreferredOpen = 25;
constexpr int kDifficultyDivisor = 10;
}  // namespace RankingWeights

/// @brief A candidate with its ranking result.
struct RankedVoicing {
  Voicing voicing;
  size_t original_index = 0;  ///< Index in the candidate list
  int transition_cost = 0;    ///< Ranking score, lower is better
  bool is_suggested = false;  ///< True for the first entry only
};

/**
 * @brief Cost of moving the hand from one voicing to another.
 *
 * Either side may be null (start or end of a progression), giving 0.
 * Only strings present in both voicings are compared.
 *
 * @return Non-negative cost, lower is easier
 */
int transitionCost(const Voicing* from, const Voicing* to);

/// @brief Reference overload of transitionCost().
inline int transitionCost(const Voicing& from, const Voicing& to) {
  return transitionCost(&from, &to);
}

/**
 * @brief Rank candidates for one chord against its neighbours.
 *
 * score = round(0.6 * cost(previous, c) + 0.4 * cost(c, next))
 *         + preference adjustment + difficultyScore / 10.
 * Stable ascending sort; the first entry is suggested.
 *
 * @param previous Voicing of the preceding chord, or nullptr
 * @param next Voicing of the following chord, or nullptr
 */
std::vector<RankedVoicing> rankVoicings(const Voicing* previous, const Voicing* next,
                                        const std::vector<Voicing>& candidates,
                                        VoicingPreference preference = VoicingPreference::Balanced);

/// @brief Original index of the suggested candidate (0 when there are none).
size_t suggestedIndex(const Voicing* previous, const Voicing* next,
                      const std::vector<Voicing>& candidates,
                      VoicingPreference preference = VoicingPreference::Balanced);

/// @brief <20 easy, <=50 medium, otherwise hard.
TransitionDifficulty categorizeCost(int cost);

/**
 * @brief Pick one voicing per chord, left to right.
 *
 * Each chord is ranked against the voicing chosen for the previous chord and
 * the first candidate of the next chord. A chord without candidates yields
 * std::nullopt and acts as a boundary for its neighbours.
 */
std::vector<std::optional<RankedVoicing>> planProgression(
    const std::vector<std::vector<Voicing>>& candidates_per_chord,
    VoicingPreference preference = VoicingPreference::Balanced);

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEQUENCER_H
