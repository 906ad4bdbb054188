/**
 * @file voicing_search.h
 * @brief Enumerate, filter, deduplicate and sort playable voicings of a chord.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEARCH_H
#define FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEARCH_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "core/chord.h"
#include "core/json_helpers.h"
#include "instrument/fretted/instrument.h"
#include "instrument/fretted/voicing.h"

namespace fretvoice {

/**
 * @brief Search constraints.
 *
 * Presets are plain values; pass them explicitly.
 */
struct SearchOptions {
  uint8_t max_fret_span = 4;          ///< Max distance between lowest and highest fretted note
  uint8_t min_fret = 0;               ///< Fret window start (0 allows open strings)
  uint8_t max_fret = 12;              ///< Fret window end (inclusive)
  bool root_in_bass = true;           ///< Lowest played string must sound the root
  bool allow_interior_mutes = true;   ///< Allow muted strings between played strings
  uint8_t min_strings_played = 3;
  uint8_t max_muted_strings = 2;
  uint8_t max_fingers = 4;
  std::optional<VoicingDifficulty> max_difficulty;  ///< Hardest category accepted

  /// @brief Default constraints (span 4, frets 0-12, root in bass).
  static SearchOptions defaults() { return SearchOptions(); }

  /// @brief Open-position shapes only: span 3, frets 0-5, no interior mutes.
  static SearchOptions beginner() {
    SearchOptions opts;
    opts.max_fret_span = 3;
    opts.max_fret = 5;
    opts.allow_interior_mutes = false;
    opts.min_strings_played = 4;
    opts.max_muted_strings = 1;
    opts.max_difficulty = VoicingDifficulty::Beginner;
    return opts;
  }

  /// @brief Frets 0-9, at most intermediate difficulty.
  static SearchOptions intermediate() {
    SearchOptions opts;
    opts.max_fret = 9;
    opts.min_strings_played = 4;
    opts.max_difficulty = VoicingDifficulty::Intermediate;
    return opts;
  }

  /// @brief Wide stretches and inversions.
  static SearchOptions advanced() {
    SearchOptions opts;
    opts.max_fret_span = 5;
    opts.root_in_bass = false;
    opts.max_muted_strings = 3;
    return opts;
  }

  /// @brief Preset for a difficulty level.
  static SearchOptions forLevel(VoicingDifficulty level) {
    switch (level) {
      case VoicingDifficulty::Beginner: return beginner();
      case VoicingDifficulty::Intermediate: return intermediate();
      case VoicingDifficulty::Advanced: return advanced();
    }
    return defaults();
  }

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("max_fret_span", self.max_fret_span);
    v("min_fret", self.min_fret);
    v("max_fret", self.max_fret);
    v("root_in_bass", self.root_in_bass);
    v("allow_interior_mutes", self.allow_interior_mutes);
    v("min_strings_played", self.min_strings_played);
    v("max_muted_strings", self.max_muted_strings);
    v("max_fingers", self.max_fingers);
  }

  /// @brief Write fields into the current JSON object. max_difficulty is omitted when unset.
  void writeTo(json::Writer& w) const;

  /// @brief Read fields from a flat JSON object. Missing keys keep their value.
  void readFrom(const json::Parser& p);

  bool operator==(const SearchOptions& other) const {
    return max_fret_span == other.max_fret_span && min_fret == other.min_fret &&
           max_fret == other.max_fret && root_in_bass == other.root_in_bass &&
           allow_interior_mutes == other.allow_interior_mutes &&
           min_strings_played == other.min_strings_played &&
           max_muted_strings == other.max_muted_strings && max_fingers == other.max_fingers &&
           max_difficulty == other.max_difficulty;
  }
  bool operator!=(const SearchOptions& other) const { return !(*this == other); }
};

// Validation error codes.
enum class SearchOptionsError : uint8_t {
  OK = 0,
  InvalidFretWindow,        // min_fret > max_fret or max_fret beyond kMaxFrets
  InvalidMinStringsPlayed,  // min_strings_played < 1 or above kMaxFrettedStrings
  InvalidMaxFingers         // max_fingers outside 1-4
};

// Validates SearchOptions.
// @returns Error code (OK if valid)
SearchOptionsError validateSearchOptions(const SearchOptions& options);

// Human-readable message for a validation error.
const char* searchOptionsErrorString(SearchOptionsError error);

/**
 * @brief Finds every valid voicing of a chord on an instrument.
 *
 * Candidate frets per string are those in the fret window whose sounding
 * pitch is a chord tone or the slash bass; muted is always a candidate. The
 * cartesian product is walked depth-first from string 0, muted first then
 * ascending frets. Accepted voicings are deduplicated by fretted shape and
 * stably sorted by difficulty score, so ties keep generation order.
 *
 * ```cpp
 * VoicingSearch search(Instruments::guitar());
 * auto voicings = search.findVoicings(*parseChord("Am"));  // includes X02210
 * ```
 */
class VoicingSearch {
 public:
  explicit VoicingSearch(Instrument instrument, SearchOptions options = SearchOptions());

  const Instrument& getInstrument() const { return instrument_; }
  const SearchOptions& getOptions() const { return options_; }

  /// @brief All valid voicings, easiest first. Empty when none qualify.
  std::vector<Voicing> findVoicings(const Chord& chord) const;

  /// @brief The first @p limit voicings of findVoicings().
  std::vector<Voicing> findEasiestVoicings(const Chord& chord, size_t limit = 5) const;

  /// @brief Voicings keyed by lowest fretted fret (0 when nothing is fretted).
  std::map<uint8_t, std::vector<Voicing>> findVoicingsGroupedByPosition(const Chord& chord) const;

  /**
   * @brief Keep one voicing per fretted shape.
   *
   * The voicing with the most played strings wins; on a tie the earlier one
   * stays. Survivors keep the position of the first voicing of their shape.
   */
  static std::vector<Voicing> dedupByShape(const std::vector<Voicing>& voicings);

  /**
   * @brief Candidate positions for one string, muted first then ascending frets.
   *
   * Frets are limited to [min_fret, min(max_fret, fret count - capo)].
   */
  std::vector<StringPosition> candidatePositions(const Chord& chord, uint8_t string_index) const;

 private:
  Instrument instrument_;
  SearchOptions options_;
};

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_VOICING_SEARCH_H
