/**
 * @file instrument.cpp
 * @brief Implementation of Instrument, tunings and presets.
 */

#include "instrument/fretted/instrument.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace fretvoice {

namespace {

std::string toLower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

struct TuningDef {
  const char* name;
  const char* notes;
};

struct InstrumentTunings {
  const char* instrument;
  uint8_t fret_count;
  const TuningDef* tunings;
  size_t count;
};

constexpr TuningDef GUITAR_TUNINGS[] = {
    {"Standard", "E2 A2 D3 G3 B3 E4"},
    {"Drop D", "D2 A2 D3 G3 B3 E4"},
    {"Drop C", "C2 G2 C3 F3 A3 D4"},
    {"Open G", "D2 G2 D3 G3 B3 D4"},
    {"Open D", "D2 A2 D3 F#3 A3 D4"},
    {"Open E", "E2 B2 E3 G#3 B3 E4"},
    {"Open A", "E2 A2 E3 A3 C#4 E4"},
    {"DADGAD", "D2 A2 D3 G3 A3 D4"},
    {"Half Step Down", "Eb2 Ab2 Db3 Gb3 Bb3 Eb4"},
    {"Whole Step Down", "D2 G2 C3 F3 A3 D4"},
    {"Double Drop D", "D2 A2 D3 G3 B3 D4"},
    {"All Fourths", "E2 A2 D3 G3 C4 F4"},
    {"New Standard", "C2 G2 D3 A3 E4 G4"},
};

constexpr TuningDef BASS_TUNINGS[] = {
    {"Standard", "E1 A1 D2 G2"},
    {"Drop D", "D1 A1 D2 G2"},
    {"Half Step Down", "Eb1 Ab1 Db2 Gb2"},
};

constexpr TuningDef UKULELE_TUNINGS[] = {
    {"Standard", "G4 C4 E4 A4"},
    {"Low G", "G3 C4 E4 A4"},
    {"D Tuning", "A4 D4 F#4 B4"},
    {"Baritone", "D3 G3 B3 E4"},
};

constexpr TuningDef CAVAQUINHO_TUNINGS[] = {
    {"Standard", "D4 G4 B4 D5"},
    {"Natural", "D4 G4 B4 E5"},
};

constexpr TuningDef BANJO_TUNINGS[] = {
    {"Open G", "G2 D3 G3 B3 D4"},
    {"Double C", "G2 C3 G3 C4 D4"},
    {"Open D", "F#2 D3 F#3 A3 D4"},
};

constexpr TuningDef GUITAR7_TUNINGS[] = {
    {"Standard", "B1 E2 A2 D3 G3 B3 E4"},
    {"Drop A", "A1 E2 A2 D3 G3 B3 E4"},
};

constexpr InstrumentTunings TUNING_TABLE[] = {
    {"guitar", 22, GUITAR_TUNINGS, sizeof(GUITAR_TUNINGS) / sizeof(GUITAR_TUNINGS[0])},
    {"bass", 20, BASS_TUNINGS, sizeof(BASS_TUNINGS) / sizeof(BASS_TUNINGS[0])},
    {"ukulele", 15, UKULELE_TUNINGS, sizeof(UKULELE_TUNINGS) / sizeof(UKULELE_TUNINGS[0])},
    {"cavaquinho", 17, CAVAQUINHO_TUNINGS,
     sizeof(CAVAQUINHO_TUNINGS) / sizeof(CAVAQUINHO_TUNINGS[0])},
    {"banjo", 22, BANJO_TUNINGS, sizeof(BANJO_TUNINGS) / sizeof(BANJO_TUNINGS[0])},
    {"7-string guitar", 22, GUITAR7_TUNINGS,
     sizeof(GUITAR7_TUNINGS) / sizeof(GUITAR7_TUNINGS[0])},
};

}  // namespace

std::optional<StringConfig> parseStringConfig(const std::string& text, uint8_t fret_count) {
  if (text.size() < 2) return std::nullopt;

  size_t note_len = 1;
  if (text[1] == '#' || text[1] == 'b') note_len = 2;
  if (text.size() <= note_len) return std::nullopt;

  auto note = parsePitchClass(text.substr(0, note_len));
  if (!note) return std::nullopt;

  int octave = 0;
  for (size_t i = note_len; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    octave = octave * 10 + (text[i] - '0');
    if (octave > 9) return std::nullopt;
  }

  return StringConfig(*note, static_cast<int8_t>(octave), fret_count);
}

// ============================================================================
// Instrument
// ============================================================================

Instrument::Instrument(std::string name, std::vector<StringConfig> strings, uint8_t capo)
    : name_(std::move(name)), strings_(std::move(strings)), capo_(capo) {}

uint8_t Instrument::availableFrets(uint8_t string_index) const {
  uint8_t frets = strings_[string_index].fret_count;
  return frets > capo_ ? static_cast<uint8_t>(frets - capo_) : 0;
}

Instrument Instrument::withCapo(uint8_t capo) const { return Instrument(name_, strings_, capo); }

std::optional<Instrument> Instrument::withTuning(const std::vector<StringConfig>& strings) const {
  if (strings.size() != strings_.size()) return std::nullopt;
  return Instrument(name_, strings, capo_);
}

std::string Instrument::toString() const {
  std::string result = name_ + " (";
  for (size_t i = 0; i < strings_.size(); ++i) {
    if (i > 0) result += " ";
    result += strings_[i].toString();
  }
  result += ")";
  if (capo_ > 0) result += " capo " + std::to_string(capo_);
  return result;
}

// ============================================================================
// Tunings
// ============================================================================

std::optional<Tuning> parseTuning(const std::string& name, const std::string& notes,
                                  uint8_t fret_count) {
  Tuning tuning;
  tuning.name = name;

  std::istringstream iss(notes);
  std::string note;
  while (iss >> note) {
    auto config = parseStringConfig(note, fret_count);
    if (!config) return std::nullopt;
    tuning.strings.push_back(*config);
  }

  if (tuning.strings.empty()) return std::nullopt;
  return tuning;
}

std::optional<Instrument> applyTuning(const Instrument& instrument, const Tuning& tuning) {
  return instrument.withTuning(tuning.strings);
}

std::vector<Tuning> getTuningsFor(const std::string& instrument_name) {
  std::vector<Tuning> result;
  std::string key = toLower(instrument_name);
  for (const auto& entry : TUNING_TABLE) {
    if (key != entry.instrument) continue;
    for (size_t i = 0; i < entry.count; ++i) {
      auto tuning = parseTuning(entry.tunings[i].name, entry.tunings[i].notes, entry.fret_count);
      if (tuning) result.push_back(*tuning);
    }
  }
  return result;
}

std::optional<Tuning> findTuning(const std::string& instrument_name,
                                 const std::string& tuning_name) {
  std::string key = toLower(tuning_name);
  for (auto& tuning : getTuningsFor(instrument_name)) {
    if (toLower(tuning.name) == key) return tuning;
  }
  return std::nullopt;
}

// ============================================================================
// Presets
// ============================================================================

namespace Instruments {

Instrument guitar() {
  return Instrument("Guitar", {{PitchClass::E, 2},
                               {PitchClass::A, 2},
                               {PitchClass::D, 3},
                               {PitchClass::G, 3},
                               {PitchClass::B, 3},
                               {PitchClass::E, 4}});
}

Instrument bass() {
  return Instrument("Bass", {{PitchClass::E, 1, 20},
                             {PitchClass::A, 1, 20},
                             {PitchClass::D, 2, 20},
                             {PitchClass::G, 2, 20}});
}

// Reentrant tuning: the G string is higher than the C string.
Instrument ukulele() {
  return Instrument("Ukulele", {{PitchClass::G, 4, 15},
                                {PitchClass::C, 4, 15},
                                {PitchClass::E, 4, 15},
                                {PitchClass::A, 4, 15}});
}

Instrument cavaquinho() {
  return Instrument("Cavaquinho", {{PitchClass::D, 4, 17},
                                   {PitchClass::G, 4, 17},
                                   {PitchClass::B, 4, 17},
                                   {PitchClass::D, 5, 17}});
}

Instrument banjo() {
  return Instrument("Banjo", {{PitchClass::G, 2},
                              {PitchClass::D, 3},
                              {PitchClass::G, 3},
                              {PitchClass::B, 3},
                              {PitchClass::D, 4}});
}

Instrument guitar7String() {
  return Instrument("7-String Guitar", {{PitchClass::B, 1},
                                        {PitchClass::E, 2},
                                        {PitchClass::A, 2},
                                        {PitchClass::D, 3},
                                        {PitchClass::G, 3},
                                        {PitchClass::B, 3},
                                        {PitchClass::E, 4}});
}

std::vector<Instrument> all() {
  return {guitar(), bass(), ukulele(), cavaquinho(), banjo(), guitar7String()};
}

std::optional<Instrument> find(const std::string& name) {
  std::string key = toLower(name);
  for (auto& instrument : all()) {
    if (toLower(instrument.getName()) == key) return instrument;
  }
  return std::nullopt;
}

}  // namespace Instruments

}  // namespace fretvoice
