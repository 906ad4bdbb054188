/**
 * @file voicing.cpp
 * @brief Implementation of Voicing and voicing text parsing.
 */

#include "instrument/fretted/voicing.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "instrument/fretted/difficulty_model.h"

namespace fretvoice {

namespace {

// Parse one delimited token: x/X muted, o/O open, otherwise a fret number.
std::optional<StringPosition> parseToken(const std::string& token) {
  if (token.empty()) return std::nullopt;
  if (token == "x" || token == "X") return StringPosition::muted();
  if (token == "o" || token == "O") return StringPosition::open();

  int fret = 0;
  for (char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    fret = fret * 10 + (c - '0');
    if (fret > kMaxFrets) return std::nullopt;
  }
  return StringPosition::fromFret(fret);
}

std::optional<std::vector<StringPosition>> parseDelimited(const std::string& text) {
  std::vector<StringPosition> positions;
  std::string token;
  for (size_t i = 0; i <= text.size(); ++i) {
    bool at_end = i == text.size();
    if (at_end || text[i] == '-' || text[i] == ' ') {
      if (!token.empty()) {
        auto pos = parseToken(token);
        if (!pos) return std::nullopt;
        positions.push_back(*pos);
        token.clear();
      } else if (!at_end && text[i] == '-') {
        return std::nullopt;  // empty field between dashes
      }
      continue;
    }
    token += text[i];
  }
  return positions;
}

std::optional<std::vector<StringPosition>> parseCompact(const std::string& text) {
  std::vector<StringPosition> positions;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '(') {
      size_t close = text.find(')', i + 1);
      if (close == std::string::npos || close == i + 1) return std::nullopt;
      auto pos = parseToken(text.substr(i + 1, close - i - 1));
      if (!pos) return std::nullopt;
      positions.push_back(*pos);
      i = close;
      continue;
    }
    auto pos = parseToken(std::string(1, c));
    if (!pos) return std::nullopt;
    positions.push_back(*pos);
  }
  return positions;
}

}  // namespace

std::optional<VoicingDifficulty> parseVoicingDifficulty(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "beginner") return VoicingDifficulty::Beginner;
  if (lower == "intermediate") return VoicingDifficulty::Intermediate;
  if (lower == "advanced") return VoicingDifficulty::Advanced;
  return std::nullopt;
}

// ============================================================================
// Voicing
// ============================================================================

Voicing::Voicing(std::vector<StringPosition> positions, std::optional<Barre> barre)
    : positions_(std::move(positions)), barre_(barre) {}

Voicing Voicing::fromFrets(const std::vector<int>& frets, std::optional<Barre> barre) {
  std::vector<StringPosition> positions;
  positions.reserve(frets.size());
  for (int fret : frets) {
    positions.push_back(StringPosition::fromFret(fret));
  }
  return Voicing(std::move(positions), barre);
}

uint8_t Voicing::playedStringCount() const {
  return static_cast<uint8_t>(std::count_if(positions_.begin(), positions_.end(),
                                            [](const StringPosition& p) { return p.isPlayed(); }));
}

uint8_t Voicing::mutedStringCount() const {
  return static_cast<uint8_t>(getStringCount() - playedStringCount());
}

uint8_t Voicing::frettedStringCount() const {
  return static_cast<uint8_t>(std::count_if(
      positions_.begin(), positions_.end(), [](const StringPosition& p) { return p.isFretted(); }));
}

uint8_t Voicing::openStringCount() const {
  return static_cast<uint8_t>(std::count_if(positions_.begin(), positions_.end(),
                                            [](const StringPosition& p) { return p.isOpen(); }));
}

std::optional<uint8_t> Voicing::lowestFret() const {
  std::optional<uint8_t> lowest;
  for (const auto& pos : positions_) {
    if (pos.isFretted() && (!lowest || pos.fret() < *lowest)) lowest = pos.fret();
  }
  return lowest;
}

std::optional<uint8_t> Voicing::highestFret() const {
  std::optional<uint8_t> highest;
  for (const auto& pos : positions_) {
    if (pos.isFretted() && (!highest || pos.fret() > *highest)) highest = pos.fret();
  }
  return highest;
}

uint8_t Voicing::fretSpan() const {
  auto lowest = lowestFret();
  auto highest = highestFret();
  if (!lowest || !highest) return 0;
  return static_cast<uint8_t>(*highest - *lowest);
}

bool Voicing::isAllOpen() const {
  return std::none_of(positions_.begin(), positions_.end(),
                      [](const StringPosition& p) { return p.isFretted(); });
}

uint8_t Voicing::interiorMuteCount() const {
  int first = -1;
  int last = -1;
  for (int i = 0; i < static_cast<int>(positions_.size()); ++i) {
    if (positions_[i].isPlayed()) {
      if (first < 0) first = i;
      last = i;
    }
  }
  if (first < 0) return 0;

  uint8_t count = 0;
  for (int i = first + 1; i < last; ++i) {
    if (positions_[i].isMuted()) ++count;
  }
  return count;
}

uint8_t Voicing::fingersRequired() const { return calculateFingersRequired(*this); }

int Voicing::difficultyScore() const { return calculateDifficultyScore(*this); }

VoicingDifficulty Voicing::difficulty() const { return categorizeDifficulty(difficultyScore()); }

std::vector<FretPosition> Voicing::frettedShape() const {
  std::vector<FretPosition> shape;
  for (size_t i = 0; i < positions_.size(); ++i) {
    if (positions_[i].isFretted()) {
      shape.emplace_back(static_cast<uint8_t>(i), positions_[i].fret());
    }
  }
  return shape;
}

std::optional<std::vector<PitchClass>> Voicing::pitchClassesOn(
    const Instrument& instrument) const {
  if (instrument.getStringCount() != positions_.size()) return std::nullopt;

  std::vector<PitchClass> pitches;
  for (size_t i = 0; i < positions_.size(); ++i) {
    if (positions_[i].isPlayed()) {
      pitches.push_back(
          instrument.soundingPitchClass(static_cast<uint8_t>(i), positions_[i].fret()));
    }
  }
  return pitches;
}

bool Voicing::playsChord(const Chord& chord, const Instrument& instrument) const {
  auto sounding = pitchClassesOn(instrument);
  if (!sounding || sounding->empty()) return false;

  auto tones = chord.pitchClasses();
  auto contains = [](const std::vector<PitchClass>& v, PitchClass pc) {
    return std::find(v.begin(), v.end(), pc) != v.end();
  };

  for (PitchClass pc : *sounding) {
    if (!contains(tones, pc) && !(chord.bass && *chord.bass == pc)) return false;
  }
  for (PitchClass pc : tones) {
    if (!contains(*sounding, pc)) return false;
  }
  return true;
}

std::string Voicing::toCompactString() const {
  std::string result;
  for (const auto& pos : positions_) {
    if (pos.isMuted()) {
      result += 'X';
    } else if (pos.fret() >= 10) {
      result += "(" + std::to_string(pos.fret()) + ")";
    } else {
      result += static_cast<char>('0' + pos.fret());
    }
  }
  return result;
}

std::optional<Voicing> parseVoicing(const std::string& text) {
  size_t begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) return std::nullopt;
  size_t end = text.find_last_not_of(" \t");
  std::string trimmed = text.substr(begin, end - begin + 1);

  bool delimited = trimmed.find_first_of("- ") != std::string::npos;
  auto positions = delimited ? parseDelimited(trimmed) : parseCompact(trimmed);
  if (!positions || positions->empty() || positions->size() > kMaxFrettedStrings) {
    return std::nullopt;
  }
  return Voicing(std::move(*positions));
}

}  // namespace fretvoice
