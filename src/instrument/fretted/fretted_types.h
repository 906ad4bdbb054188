/**
 * @file fretted_types.h
 * @brief Core data types for fretted instrument modeling.
 *
 * Defines string configuration and fretboard position types shared by the
 * instrument model, voicing search and transition scoring.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_FRETTED_TYPES_H
#define FRETVOICE_INSTRUMENT_FRETTED_FRETTED_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

#include "core/pitch_class.h"

namespace fretvoice {

/// @brief Maximum number of strings supported (8-string guitar).
constexpr uint8_t kMaxFrettedStrings = 8;

/// @brief Maximum fret number (24-fret guitars).
constexpr uint8_t kMaxFrets = 24;

/// @brief Default fret count for a string.
constexpr uint8_t kDefaultFretCount = 22;

/// @brief Configuration for a single string.
struct StringConfig {
  PitchClass open_note;  ///< Pitch class of the unfretted string
  int8_t octave;         ///< Octave of the open string (E2 -> 2)
  uint8_t fret_count;    ///< Number of frets on this string

  /// @brief Default constructor (E2, 22 frets).
  StringConfig() : open_note(PitchClass::E), octave(2), fret_count(kDefaultFretCount) {}

  /// @brief Construct with open note, octave and fret count.
  StringConfig(PitchClass note, int8_t oct, uint8_t frets = kDefaultFretCount)
      : open_note(note), octave(oct), fret_count(frets) {}

  /// @brief Pitch class sounding at a fret (no capo).
  PitchClass pitchClassAt(uint8_t fret) const { return transposePitchClass(open_note, fret); }

  /// @brief Display text such as "E2" or "F#3".
  std::string toString() const {
    return std::string(pitchClassName(open_note)) + std::to_string(octave);
  }

  bool operator==(const StringConfig& other) const {
    return open_note == other.open_note && octave == other.octave &&
           fret_count == other.fret_count;
  }
  bool operator!=(const StringConfig& other) const { return !(*this == other); }
};

/**
 * @brief Parse a string note like "E2" or "G#3".
 * @param text Note name followed by an octave number
 * @param fret_count Fret count for the resulting string
 * @return String config, or std::nullopt if the text is malformed
 */
std::optional<StringConfig> parseStringConfig(const std::string& text,
                                              uint8_t fret_count = kDefaultFretCount);

/// @brief Position on the fretboard (string + fret).
struct FretPosition {
  uint8_t string;  ///< String number (0 = lowest pitch string)
  uint8_t fret;    ///< Fret number (0 = open string)

  FretPosition() : string(0), fret(0) {}
  FretPosition(uint8_t s, uint8_t f) : string(s), fret(f) {}

  bool operator==(const FretPosition& other) const {
    return string == other.string && fret == other.fret;
  }
  bool operator!=(const FretPosition& other) const { return !(*this == other); }

  /// @brief Ordering by string, then fret.
  bool operator<(const FretPosition& other) const {
    return string != other.string ? string < other.string : fret < other.fret;
  }
};

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_FRETTED_TYPES_H
