/**
 * @file voicing_sequencer.cpp
 * @brief Implementation of transition costs and candidate ranking.
 */

#include "instrument/fretted/voicing_sequencer.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace fretvoice {

namespace {

bool hasSimilarShape(const Voicing& from, const Voicing& to) {
  int span_diff = std::abs(from.fretSpan() - to.fretSpan());
  int finger_diff = std::abs(from.fingersRequired() - to.fingersRequired());
  return span_diff <= TransitionCostWeights::kSimilarShapeTolerance &&
         finger_diff <= TransitionCostWeights::kSimilarShapeTolerance;
}

int preferenceAdjustment(const Voicing& voicing, VoicingPreference preference) {
  using namespace RankingWeights;
  switch (preference) {
    case VoicingPreference::PreferOpen:
      return voicing.requiresBarre() ? kOpenPreferredBarre : kOpenPreferredOpen;
    case VoicingPreference::PreferBarre:
      return voicing.requiresBarre() ? kBarrePreferredBarre : kBarrePreferredOpen;
    case VoicingPreference::Balanced:
      return 0;
  }
  return 0;
}

}  // namespace

std::optional<VoicingPreference> parseVoicingPreference(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "open") return VoicingPreference::PreferOpen;
  if (lower == "barre") return VoicingPreference::PreferBarre;
  if (lower == "balanced") return VoicingPreference::Balanced;
  return std::nullopt;
}

int transitionCost(const Voicing* from, const Voicing* to) {
  if (!from || !to) return 0;

  using namespace TransitionCostWeights;
  int cost = 0;

  // Hand movement along the neck
  int from_position = from->lowestFret().value_or(0);
  int to_position = to->lowestFret().value_or(0);
  cost += std::abs(from_position - to_position) * kPerPositionFret;

  // Per-string finger movement
  size_t shared = std::min(from->getPositions().size(), to->getPositions().size());
  for (size_t i = 0; i < shared; ++i) {
    const auto& a = from->getPositions()[i];
    const auto& b = to->getPositions()[i];
    if (a.isFretted() && b.isFretted()) {
      cost += std::abs(a.fret() - b.fret()) * kPerStringFret;
    } else if (a.isFretted() != b.isFretted()) {
      cost += kFrettedStateChange;
    }
  }

  if (from->requiresBarre() != to->requiresBarre()) cost += kBarreChange;

  if (hasSimilarShape(*from, *to)) cost += kSimilarShapeBonus;

  return cost < 0 ? 0 : cost;
}

std::vector<RankedVoicing> rankVoicings(const Voicing* previous, const Voicing* next,
                                        const std::vector<Voicing>& candidates,
                                        VoicingPreference preference) {
  std::vector<RankedVoicing> ranked;
  ranked.reserve(candidates.size());

  for (size_t i = 0; i < candidates.size(); ++i) {
    const Voicing& candidate = candidates[i];
    double weighted = RankingWeights::kPrevious * transitionCost(previous, &candidate) +
                      RankingWeights::kNext * transitionCost(&candidate, next);

    RankedVoicing entry;
    entry.voicing = candidate;
    entry.original_index = i;
    entry.transition_cost = static_cast<int>(std::lround(weighted)) +
                            preferenceAdjustment(candidate, preference) +
                            candidate.difficultyScore() / RankingWeights::kDifficultyDivisor;
    ranked.push_back(std::move(entry));
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedVoicing& a, const RankedVoicing& b) {
                     return a.transition_cost < b.transition_cost;
                   });
  if (!ranked.empty()) ranked.front().is_suggested = true;
  return ranked;
}

size_t suggestedIndex(const Voicing* previous, const Voicing* next,
                      const std::vector<Voicing>& candidates, VoicingPreference preference) {
  auto ranked = rankVoicings(previous, next, candidates, preference);
  if (ranked.empty()) return 0;
  return ranked.front().original_index;
}

TransitionDifficulty categorizeCost(int cost) {
  if (cost < 20) return TransitionDifficulty::Easy;
  if (cost <= 50) return TransitionDifficulty::Medium;
  return TransitionDifficulty::Hard;
}

std::vector<std::optional<RankedVoicing>> planProgression(
    const std::vector<std::vector<Voicing>>& candidates_per_chord, VoicingPreference preference) {
  std::vector<std::optional<RankedVoicing>> plan;
  plan.reserve(candidates_per_chord.size());

  for (size_t i = 0; i < candidates_per_chord.size(); ++i) {
    const Voicing* previous = (i > 0 && plan.back()) ? &plan.back()->voicing : nullptr;

    const Voicing* next = nullptr;
    if (i + 1 < candidates_per_chord.size() && !candidates_per_chord[i + 1].empty()) {
      next = &candidates_per_chord[i + 1].front();
    }

    auto ranked = rankVoicings(previous, next, candidates_per_chord[i], preference);
    if (ranked.empty()) {
      plan.emplace_back(std::nullopt);
    } else {
      plan.emplace_back(std::move(ranked.front()));
    }
  }

  return plan;
}

}  // namespace fretvoice
