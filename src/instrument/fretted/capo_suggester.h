/**
 * @file capo_suggester.h
 * @brief Capo placement suggestions that turn hard chord shapes into open ones.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_CAPO_SUGGESTER_H
#define FRETVOICE_INSTRUMENT_FRETTED_CAPO_SUGGESTER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/chord.h"
#include "instrument/fretted/instrument.h"

namespace fretvoice {

/// @brief One capo position and the shapes fingered with it.
struct CapoSuggestion {
  uint8_t capo_fret = 0;               ///< 0 = no capo
  std::vector<Chord> shapes;           ///< Each original chord transposed down by capo_fret
  std::vector<Chord> original_chords;  ///< Chords as they sound
  double difficulty_score = 0.0;       ///< Sum of per-shape scores, lower is easier

  /// @brief Shape chord symbols in progression order.
  std::vector<std::string> shapeSymbols() const;

  /// @brief "No capo needed" or "Capo fret 3: play C, G, Am".
  std::string description() const;
};

/// @brief Per-shape scores of the fingering heuristic.
namespace CapoShapeScores {
constexpr double kEasyOpen = 1.0;      ///< Open majors and minors, plus their 7ths
constexpr double kModerateOpen = 2.0;  ///< F, B7, Fmaj7 Cmaj7 Dmaj7 Amaj7
constexpr double kSimpleBarre = 3.0;   ///< Any other major or minor triad (E or A shape barre)
constexpr double kOther = 4.0;
}  // namespace CapoShapeScores

/**
 * @brief Scores a chord shape with a fixed open-chord lookup.
 *
 * The lookup is instrument-agnostic and does not run a voicing search.
 */
double chordShapeScore(const Chord& shape);

/**
 * @brief Ranks capo positions for a chord progression.
 *
 * ```cpp
 * CapoSuggester suggester(Instruments::guitar());
 * auto best = suggester.suggestBest({*parseChord("F"), *parseChord("Bb")});
 * best->description();  // "Capo fret 1: play E, A"
 * ```
 */
class CapoSuggester {
 public:
  explicit CapoSuggester(Instrument instrument, uint8_t max_capo_fret = 12);

  const Instrument& getInstrument() const { return instrument_; }
  uint8_t getMaxCapoFret() const { return max_capo_fret_; }

  /**
   * @brief One suggestion per capo fret 0..max, stably sorted by score.
   * @return Exactly max_capo_fret + 1 entries, or none for an empty progression
   */
  std::vector<CapoSuggestion> suggest(const std::vector<Chord>& chords) const;

  /// @brief Lowest-scoring suggestion, or std::nullopt for an empty progression.
  std::optional<CapoSuggestion> suggestBest(const std::vector<Chord>& chords) const;

 private:
  Instrument instrument_;
  uint8_t max_capo_fret_;
};

/// @brief Well-known capo positions for hard major keys.
namespace CommonCapoPositions {

/// @brief Open shape reached from a chord with a capo.
struct CapoShape {
  PitchClass shape_root;  ///< Root of the fingered shape
  uint8_t capo_fret;
};

/// @brief Tabulated shapes for a hard major root (F -> E:1, D:3, C:5). Empty if untabulated.
std::vector<CapoShape> majorTransformations(PitchClass root);

/**
 * @brief Capo frets that turn a chord into an easier shape, ascending.
 *
 * Major chords use the table ({0} when the root is not tabulated). Other
 * qualities use the forward semitone distance from each easy root
 * ({A, E, D} for minor, {C, G, D, E, A} otherwise), excluding 0.
 */
std::vector<int> forChord(const Chord& chord);

}  // namespace CommonCapoPositions

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_CAPO_SUGGESTER_H
