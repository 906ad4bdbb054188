/**
 * @file pitch_class.cpp
 * @brief Pitch class names and parsing.
 */

#include "core/pitch_class.h"

#include <cctype>

namespace fretvoice {

namespace {

constexpr const char* PITCH_CLASS_NAMES[kPitchClassCount] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B",
};

// Natural note letters to semitone index (A..G).
constexpr int LETTER_OFFSETS[7] = {9, 11, 0, 2, 4, 5, 7};

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

}  // namespace

const char* pitchClassName(PitchClass pc) { return PITCH_CLASS_NAMES[pitchClassIndex(pc)]; }

std::optional<PitchClass> parsePitchClass(const std::string& text) {
  std::string s = trim(text);
  if (s.empty() || s.size() > 2) return std::nullopt;

  char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(s[0])));
  if (letter < 'a' || letter > 'g') return std::nullopt;
  int index = LETTER_OFFSETS[letter - 'a'];

  if (s.size() == 2) {
    char accidental = static_cast<char>(std::tolower(static_cast<unsigned char>(s[1])));
    if (accidental == '#') {
      ++index;
    } else if (accidental == 'b') {
      --index;
    } else {
      return std::nullopt;
    }
  }

  return pitchClassFromIndex(index);
}

}  // namespace fretvoice
