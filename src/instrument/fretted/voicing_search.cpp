/**
 * @file voicing_search.cpp
 * @brief Implementation of VoicingSearch.
 */

#include "instrument/fretted/voicing_search.h"

#include <algorithm>
#include <array>
#include <utility>

// Debug flag for search tracing (set to 1 to enable)
#ifndef FRETVOICE_SEARCH_DEBUG_LOG
#define FRETVOICE_SEARCH_DEBUG_LOG 0
#endif

#if FRETVOICE_SEARCH_DEBUG_LOG
#include <iostream>
#endif

namespace fretvoice {

namespace {

using PitchSet = std::array<bool, kPitchClassCount>;

/// Reason a complete assignment was rejected.
enum class Rejection : uint8_t {
  None = 0,
  TooFewPlayed,
  TooManyMuted,
  SpanTooWide,
  TooManyFingers,
  InteriorMute,
  MissingRoot,
  WrongBass,
  ForeignNote,
  MissingChordTone,
  TooFewPitchClasses,
  TooDifficult,
  Count
};

#if FRETVOICE_SEARCH_DEBUG_LOG
const char* rejectionToString(Rejection r) {
  switch (r) {
    case Rejection::None: return "accepted";
    case Rejection::TooFewPlayed: return "too_few_played";
    case Rejection::TooManyMuted: return "too_many_muted";
    case Rejection::SpanTooWide: return "span_too_wide";
    case Rejection::TooManyFingers: return "too_many_fingers";
    case Rejection::InteriorMute: return "interior_mute";
    case Rejection::MissingRoot: return "missing_root";
    case Rejection::WrongBass: return "wrong_bass";
    case Rejection::ForeignNote: return "foreign_note";
    case Rejection::MissingChordTone: return "missing_chord_tone";
    case Rejection::TooFewPitchClasses: return "too_few_pitch_classes";
    case Rejection::TooDifficult: return "too_difficult";
    case Rejection::Count: break;
  }
  return "unknown";
}
#endif

/// Chord data resolved once per search.
struct ChordTarget {
  PitchClass root;
  PitchClass required_bass;
  bool check_bass;
  PitchSet allowed{};  ///< Chord tones plus slash bass
  std::vector<PitchClass> tones;
};

ChordTarget resolveTarget(const Chord& chord, const SearchOptions& options) {
  ChordTarget target;
  target.root = chord.root;
  target.required_bass = chord.bass.value_or(chord.root);
  target.check_bass = options.root_in_bass || chord.hasBass();
  target.tones = chord.pitchClasses();
  for (PitchClass pc : target.tones) target.allowed[pitchClassIndex(pc)] = true;
  if (chord.bass) target.allowed[pitchClassIndex(*chord.bass)] = true;
  return target;
}

Rejection checkVoicing(const Voicing& voicing, const ChordTarget& target,
                       const Instrument& instrument, const SearchOptions& options) {
  if (voicing.playedStringCount() < options.min_strings_played) return Rejection::TooFewPlayed;
  if (voicing.mutedStringCount() > options.max_muted_strings) return Rejection::TooManyMuted;
  if (voicing.fretSpan() > options.max_fret_span) return Rejection::SpanTooWide;
  if (voicing.fingersRequired() > options.max_fingers) return Rejection::TooManyFingers;
  if (!options.allow_interior_mutes && voicing.hasInteriorMute()) return Rejection::InteriorMute;

  auto sounding = voicing.pitchClassesOn(instrument);
  if (!sounding || sounding->empty()) return Rejection::TooFewPlayed;

  PitchSet present{};
  for (PitchClass pc : *sounding) present[pitchClassIndex(pc)] = true;

  if (!present[pitchClassIndex(target.root)]) return Rejection::MissingRoot;

  // pitchClassesOn lists played strings low to high, so the first is the bass.
  if (target.check_bass && sounding->front() != target.required_bass) return Rejection::WrongBass;

  int distinct = 0;
  for (int i = 0; i < kPitchClassCount; ++i) {
    if (!present[i]) continue;
    if (!target.allowed[i]) return Rejection::ForeignNote;
    ++distinct;
  }

  for (PitchClass pc : target.tones) {
    if (!present[pitchClassIndex(pc)]) return Rejection::MissingChordTone;
  }

  if (distinct < 2) return Rejection::TooFewPitchClasses;

  if (options.max_difficulty && voicing.difficulty() > *options.max_difficulty) {
    return Rejection::TooDifficult;
  }

  return Rejection::None;
}

/// Depth-first walk over the per-string candidates.
class Enumerator {
 public:
  Enumerator(const std::vector<std::vector<StringPosition>>& candidates,
             const ChordTarget& target, const Instrument& instrument,
             const SearchOptions& options)
      : candidates_(candidates), target_(target), instrument_(instrument), options_(options) {
    current_.reserve(candidates.size());
  }

  std::vector<Voicing> run() {
    walk(0, 0, 0, 0);
#if FRETVOICE_SEARCH_DEBUG_LOG
    std::cerr << "[search] complete assignments: " << visited_ << ", pruned: " << pruned_
              << "\n";
    for (size_t i = 0; i < rejections_.size(); ++i) {
      if (rejections_[i] == 0) continue;
      std::cerr << "  " << rejectionToString(static_cast<Rejection>(i)) << ": "
                << rejections_[i] << "\n";
    }
#endif
    return std::move(accepted_);
  }

 private:
  // Muted count and fret span only grow as strings are added, so a partial
  // assignment that already exceeds either limit cannot be completed.
  void walk(size_t string_index, uint8_t muted, uint8_t low, uint8_t high) {
    if (string_index == candidates_.size()) {
      visit();
      return;
    }

    for (const auto& pos : candidates_[string_index]) {
      uint8_t next_muted = muted;
      uint8_t next_low = low;
      uint8_t next_high = high;

      if (pos.isMuted()) {
        if (++next_muted > options_.max_muted_strings) {
          ++pruned_;
          continue;
        }
      } else if (pos.isFretted()) {
        next_low = (low == 0 || pos.fret() < low) ? pos.fret() : low;
        next_high = pos.fret() > high ? pos.fret() : high;
        if (next_high - next_low > options_.max_fret_span) {
          ++pruned_;
          continue;
        }
      }

      current_.push_back(pos);
      walk(string_index + 1, next_muted, next_low, next_high);
      current_.pop_back();
    }
  }

  void visit() {
    ++visited_;
    Voicing voicing(current_);
    Rejection result = checkVoicing(voicing, target_, instrument_, options_);
    ++rejections_[static_cast<size_t>(result)];
    if (result == Rejection::None) accepted_.push_back(std::move(voicing));
  }

  const std::vector<std::vector<StringPosition>>& candidates_;
  const ChordTarget& target_;
  const Instrument& instrument_;
  const SearchOptions& options_;

  std::vector<StringPosition> current_;
  std::vector<Voicing> accepted_;
  std::array<size_t, static_cast<size_t>(Rejection::Count)> rejections_{};
  size_t visited_ = 0;
  size_t pruned_ = 0;
};

}  // namespace

// ============================================================================
// SearchOptions
// ============================================================================

void SearchOptions::writeTo(json::Writer& w) const {
  json::WriteVisitor v{w};
  visitFields(*this, v);
  if (max_difficulty) w.write("max_difficulty", voicingDifficultyToString(*max_difficulty));
}

void SearchOptions::readFrom(const json::Parser& p) {
  json::ReadVisitor v{p};
  visitFields(*this, v);
  if (p.has("max_difficulty")) {
    // null or an unknown name clears the limit
    max_difficulty = parseVoicingDifficulty(p.getString("max_difficulty"));
  }
}

SearchOptionsError validateSearchOptions(const SearchOptions& options) {
  if (options.min_fret > options.max_fret || options.max_fret > kMaxFrets) {
    return SearchOptionsError::InvalidFretWindow;
  }

  if (options.min_strings_played < 1 || options.min_strings_played > kMaxFrettedStrings) {
    return SearchOptionsError::InvalidMinStringsPlayed;
  }

  if (options.max_fingers < 1 || options.max_fingers > 4) {
    return SearchOptionsError::InvalidMaxFingers;
  }

  return SearchOptionsError::OK;
}

const char* searchOptionsErrorString(SearchOptionsError error) {
  switch (error) {
    case SearchOptionsError::OK: return "ok";
    case SearchOptionsError::InvalidFretWindow: return "invalid fret window";
    case SearchOptionsError::InvalidMinStringsPlayed: return "invalid min_strings_played";
    case SearchOptionsError::InvalidMaxFingers: return "max_fingers must be 1-4";
  }
  return "unknown error";
}

// ============================================================================
// VoicingSearch
// ============================================================================

VoicingSearch::VoicingSearch(Instrument instrument, SearchOptions options)
    : instrument_(std::move(instrument)), options_(std::move(options)) {}

std::vector<StringPosition> VoicingSearch::candidatePositions(const Chord& chord,
                                                              uint8_t string_index) const {
  std::vector<StringPosition> positions;
  positions.push_back(StringPosition::muted());

  PitchSet allowed{};
  for (PitchClass pc : chord.pitchClasses()) allowed[pitchClassIndex(pc)] = true;
  if (chord.bass) allowed[pitchClassIndex(*chord.bass)] = true;

  uint8_t top = std::min(options_.max_fret, instrument_.availableFrets(string_index));
  for (int fret = options_.min_fret; fret <= top; ++fret) {
    PitchClass pc = instrument_.soundingPitchClass(string_index, static_cast<uint8_t>(fret));
    if (allowed[pitchClassIndex(pc)]) {
      positions.push_back(StringPosition::fromFret(fret));
    }
  }

  return positions;
}

std::vector<Voicing> VoicingSearch::findVoicings(const Chord& chord) const {
  if (instrument_.getStringCount() == 0) return {};

  std::vector<std::vector<StringPosition>> candidates;
  candidates.reserve(instrument_.getStringCount());
  for (uint8_t i = 0; i < instrument_.getStringCount(); ++i) {
    candidates.push_back(candidatePositions(chord, i));
#if FRETVOICE_SEARCH_DEBUG_LOG
    std::cerr << "[search] " << chord.symbol() << " string " << static_cast<int>(i) << ": "
              << candidates.back().size() - 1 << " fret options\n";
#endif
  }

  ChordTarget target = resolveTarget(chord, options_);
  auto accepted = Enumerator(candidates, target, instrument_, options_).run();

  auto result = dedupByShape(accepted);
#if FRETVOICE_SEARCH_DEBUG_LOG
  std::cerr << "[search] accepted " << accepted.size() << ", after dedup " << result.size()
            << "\n";
#endif

  std::stable_sort(result.begin(), result.end(), [](const Voicing& a, const Voicing& b) {
    return a.difficultyScore() < b.difficultyScore();
  });
  return result;
}

std::vector<Voicing> VoicingSearch::findEasiestVoicings(const Chord& chord, size_t limit) const {
  auto voicings = findVoicings(chord);
  if (voicings.size() > limit) voicings.resize(limit);
  return voicings;
}

std::map<uint8_t, std::vector<Voicing>> VoicingSearch::findVoicingsGroupedByPosition(
    const Chord& chord) const {
  std::map<uint8_t, std::vector<Voicing>> grouped;
  for (auto& voicing : findVoicings(chord)) {
    grouped[voicing.lowestFret().value_or(0)].push_back(std::move(voicing));
  }
  return grouped;
}

std::vector<Voicing> VoicingSearch::dedupByShape(const std::vector<Voicing>& voicings) {
  std::vector<Voicing> result;
  std::map<std::vector<FretPosition>, size_t> slot_by_shape;

  for (const auto& voicing : voicings) {
    auto shape = voicing.frettedShape();
    auto it = slot_by_shape.find(shape);
    if (it == slot_by_shape.end()) {
      slot_by_shape.emplace(std::move(shape), result.size());
      result.push_back(voicing);
    } else if (voicing.playedStringCount() > result[it->second].playedStringCount()) {
      result[it->second] = voicing;
    }
  }

  return result;
}

}  // namespace fretvoice
