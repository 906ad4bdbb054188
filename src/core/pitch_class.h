/**
 * @file pitch_class.h
 * @brief Twelve-tone pitch classes with modular transposition.
 */

#ifndef FRETVOICE_CORE_PITCH_CLASS_H
#define FRETVOICE_CORE_PITCH_CLASS_H

#include <cstdint>
#include <optional>
#include <string>

namespace fretvoice {

/// Number of pitch classes in an octave.
constexpr int kPitchClassCount = 12;

/// @brief The 12 chromatic pitch classes (sharp spelling).
enum class PitchClass : uint8_t {
  C = 0,
  CSharp,
  D,
  DSharp,
  E,
  F,
  FSharp,
  G,
  GSharp,
  A,
  ASharp,
  B
};

/// @brief Get the index of a pitch class (C = 0 .. B = 11).
inline int pitchClassIndex(PitchClass pc) { return static_cast<int>(pc); }

/// @brief Build a pitch class from any integer (wraps modulo 12).
inline PitchClass pitchClassFromIndex(int index) {
  int wrapped = index % kPitchClassCount;
  if (wrapped < 0) wrapped += kPitchClassCount;
  return static_cast<PitchClass>(wrapped);
}

/// @brief Transpose a pitch class by a signed number of semitones.
inline PitchClass transposePitchClass(PitchClass pc, int semitones) {
  return pitchClassFromIndex(pitchClassIndex(pc) + semitones);
}

/// @brief Forward distance in semitones from one pitch class to another (0-11).
inline int semitonesUp(PitchClass from, PitchClass to) {
  int diff = pitchClassIndex(to) - pitchClassIndex(from);
  return diff < 0 ? diff + kPitchClassCount : diff;
}

/// @brief Display name using sharps ("C", "C#", ... "B").
const char* pitchClassName(PitchClass pc);

/**
 * @brief Parse a pitch class name.
 *
 * Accepts sharps and flats in any case, including the enharmonic spellings
 * B#, Cb, E# and Fb.
 *
 * @param text Note name such as "Eb" or "f#"
 * @return Pitch class, or std::nullopt if the text is not a note name
 */
std::optional<PitchClass> parsePitchClass(const std::string& text);

}  // namespace fretvoice

#endif  // FRETVOICE_CORE_PITCH_CLASS_H
