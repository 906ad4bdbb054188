/**
 * @file instrument.h
 * @brief Fretted instrument model with tuning and capo.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_INSTRUMENT_H
#define FRETVOICE_INSTRUMENT_FRETTED_INSTRUMENT_H

#include <optional>
#include <string>
#include <vector>

#include "instrument/fretted/fretted_types.h"

namespace fretvoice {

/**
 * @brief A stringed, fretted instrument.
 *
 * Strings are ordered from lowest pitch (index 0) to highest. A single capo
 * offset shifts the sounding pitch of every string uniformly.
 */
class Instrument {
 public:
  Instrument() = default;

  /// @brief Construct with name, strings (low to high) and capo fret.
  Instrument(std::string name, std::vector<StringConfig> strings, uint8_t capo = 0);

  const std::string& getName() const { return name_; }

  /// @brief Number of strings.
  uint8_t getStringCount() const { return static_cast<uint8_t>(strings_.size()); }

  const std::vector<StringConfig>& getStrings() const { return strings_; }

  const StringConfig& getString(uint8_t index) const { return strings_[index]; }

  /// @brief Capo fret (0 = no capo).
  uint8_t getCapo() const { return capo_; }

  /**
   * @brief Pitch class sounding on a string at a fret, capo included.
   * @param string_index String (0 = lowest)
   * @param fret Fret relative to the capo (0 = open/capo)
   */
  PitchClass soundingPitchClass(uint8_t string_index, uint8_t fret) const {
    return transposePitchClass(strings_[string_index].open_note, fret + capo_);
  }

  /// @brief Frets playable above the capo on a string (never negative).
  uint8_t availableFrets(uint8_t string_index) const;

  /// @brief Copy of this instrument with a different capo fret.
  Instrument withCapo(uint8_t capo) const;

  /**
   * @brief Copy of this instrument with new strings.
   * @return Retuned instrument, or std::nullopt if the string count differs
   */
  std::optional<Instrument> withTuning(const std::vector<StringConfig>& strings) const;

  /// @brief Display text such as "Guitar (E2 A2 D3 G3 B3 E4)".
  std::string toString() const;

  bool operator==(const Instrument& other) const {
    return name_ == other.name_ && strings_ == other.strings_ && capo_ == other.capo_;
  }
  bool operator!=(const Instrument& other) const { return !(*this == other); }

 private:
  std::string name_;
  std::vector<StringConfig> strings_;
  uint8_t capo_ = 0;
};

/// @brief A named set of open-string notes.
struct Tuning {
  std::string name;
  std::vector<StringConfig> strings;

  uint8_t getStringCount() const { return static_cast<uint8_t>(strings.size()); }
};

/**
 * @brief Parse a tuning from space-separated notes ("D2 A2 D3 G3 B3 E4").
 * @return Tuning, or std::nullopt if any note is malformed or the list is empty
 */
std::optional<Tuning> parseTuning(const std::string& name, const std::string& notes,
                                  uint8_t fret_count = kDefaultFretCount);

/**
 * @brief Apply a tuning to an instrument.
 * @return Retuned instrument, or std::nullopt if the string counts differ
 */
std::optional<Instrument> applyTuning(const Instrument& instrument, const Tuning& tuning);

/// @brief Preset instruments.
namespace Instruments {
Instrument guitar();
Instrument bass();
Instrument ukulele();
Instrument cavaquinho();
Instrument banjo();
Instrument guitar7String();

/// @brief All presets, in the order above.
std::vector<Instrument> all();

/// @brief Find a preset by case-insensitive name ("guitar", "7-string guitar").
std::optional<Instrument> find(const std::string& name);
}  // namespace Instruments

/**
 * @brief Named tunings for a preset instrument.
 * @param instrument_name Preset name (case-insensitive)
 * @return Tunings, standard first; empty for an unknown instrument
 */
std::vector<Tuning> getTuningsFor(const std::string& instrument_name);

/// @brief Find a named tuning for a preset instrument (case-insensitive).
std::optional<Tuning> findTuning(const std::string& instrument_name,
                                 const std::string& tuning_name);

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_INSTRUMENT_H
