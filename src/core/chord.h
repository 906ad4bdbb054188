/**
 * @file chord.h
 * @brief Chord qualities, chord symbols and slash-chord bass notes.
 */

#ifndef FRETVOICE_CORE_CHORD_H
#define FRETVOICE_CORE_CHORD_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/pitch_class.h"

namespace fretvoice {

/// @brief Chord quality.
enum class ChordType : uint8_t {
  // Triads
  Major,
  Minor,
  Diminished,
  Augmented,
  Sus2,
  Sus4,
  // Sevenths
  Dominant7,
  Major7,
  Minor7,
  MinorMajor7,
  Diminished7,
  HalfDiminished7,
  Augmented7,
  // Extended
  Add9,
  MinorAdd9,
  Dominant9,
  Major9,
  Minor9,
  Dominant7Flat9,
  Dominant7Sharp9,
  Dominant7Flat13,
  Dominant7Sharp11,
  Dominant11,
  Dominant13,
  // Sixths
  Major6,
  Minor6,
  SixNine,
  // Dyad
  Power
};

/// Number of ChordType values.
constexpr uint8_t kChordTypeCount = 28;

/// Maximum number of intervals in a chord formula (13th chords).
constexpr uint8_t kMaxChordIntervals = 6;

/**
 * @brief Static description of a chord quality.
 *
 * Intervals are semitones above the root; index 0 is always 0 (the root).
 * Compound intervals (9ths, 11ths, 13ths) keep their true size.
 */
struct ChordTypeInfo {
  const char* name;    ///< Full name ("minor seventh")
  const char* symbol;  ///< Symbol suffix ("m7")
  std::array<int8_t, kMaxChordIntervals> intervals;
  uint8_t interval_count;
};

/// @brief Get the description of a chord quality.
const ChordTypeInfo& getChordTypeInfo(ChordType type);

/**
 * @brief A chord: root, quality and optional slash bass note.
 *
 * Value type; compares structurally.
 */
struct Chord {
  PitchClass root = PitchClass::C;
  ChordType type = ChordType::Major;
  std::optional<PitchClass> bass;  ///< Slash-chord bass (e.g. G in C/G)

  Chord() = default;
  Chord(PitchClass r, ChordType t, std::optional<PitchClass> b = std::nullopt)
      : root(r), type(t), bass(b) {}

  /// @brief Semitone offsets from the root, root first.
  std::vector<int> intervals() const;

  /// @brief Chord tones as pitch classes, root first, in formula order.
  std::vector<PitchClass> pitchClasses() const;

  /// @brief Whether this is a slash chord.
  bool hasBass() const { return bass.has_value(); }

  /// @brief Transpose root and bass by a signed number of semitones.
  Chord transpose(int semitones) const;

  /// @brief Chord symbol ("C", "Am", "G7", "C/G").
  std::string symbol() const;

  /// @brief Full name ("C major", "C major over G").
  std::string name() const;

  bool operator==(const Chord& other) const {
    return root == other.root && type == other.type && bass == other.bass;
  }
  bool operator!=(const Chord& other) const { return !(*this == other); }
};

/**
 * @brief Parse a chord symbol.
 *
 * Accepts a root (with optional # or b), a quality suffix in the common
 * spellings (maj/M, min/m/-, dim/°, aug/+, sus, 7, maj7/Δ, m7b5/ø, 9, 13, ...),
 * parenthesised alterations (Cm7(b5)) and a trailing slash bass (C/G).
 *
 * @param text Chord symbol
 * @return Chord, or std::nullopt if the symbol is not recognised
 */
std::optional<Chord> parseChord(const std::string& text);

/**
 * @brief Parse a chord quality suffix ("", "m", "maj7", ...).
 * @return Quality, or std::nullopt for an unknown suffix
 */
std::optional<ChordType> parseChordType(const std::string& suffix);

}  // namespace fretvoice

#endif  // FRETVOICE_CORE_CHORD_H
