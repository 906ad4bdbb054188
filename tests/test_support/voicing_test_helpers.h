/**
 * @file voicing_test_helpers.h
 * @brief Shared helpers for voicing, search and sequencer tests.
 */

#ifndef FRETVOICE_TEST_VOICING_TEST_HELPERS_H
#define FRETVOICE_TEST_VOICING_TEST_HELPERS_H

#include <algorithm>
#include <string>
#include <vector>

#include "core/chord.h"
#include "instrument/fretted/voicing.h"

namespace fretvoice {
namespace test {

/// Parse a chord symbol known to be valid.
inline Chord chord(const std::string& symbol) { return parseChord(symbol).value(); }

/// Parse a voicing string known to be valid.
inline Voicing voicing(const std::string& text) { return parseVoicing(text).value(); }

/// True if any voicing in the list prints as @p compact ("X02210").
inline bool containsVoicing(const std::vector<Voicing>& voicings, const std::string& compact) {
  return std::any_of(voicings.begin(), voicings.end(),
                     [&](const Voicing& v) { return v.toCompactString() == compact; });
}

/// Index of the voicing printing as @p compact, or voicings.size() if absent.
inline size_t indexOfVoicing(const std::vector<Voicing>& voicings, const std::string& compact) {
  for (size_t i = 0; i < voicings.size(); ++i) {
    if (voicings[i].toCompactString() == compact) return i;
  }
  return voicings.size();
}

}  // namespace test
}  // namespace fretvoice

#endif  // FRETVOICE_TEST_VOICING_TEST_HELPERS_H
