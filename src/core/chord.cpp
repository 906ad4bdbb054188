/**
 * @file chord.cpp
 * @brief Chord quality table and chord symbol parsing.
 */

#include "core/chord.h"

#include <cctype>

namespace fretvoice {

namespace {

// Chord quality table, indexed by ChordType.
constexpr ChordTypeInfo CHORD_TYPES[kChordTypeCount] = {
    {"major", "", {0, 4, 7, 0, 0, 0}, 3},
    {"minor", "m", {0, 3, 7, 0, 0, 0}, 3},
    {"diminished", "dim", {0, 3, 6, 0, 0, 0}, 3},
    {"augmented", "aug", {0, 4, 8, 0, 0, 0}, 3},
    {"suspended 2nd", "sus2", {0, 2, 7, 0, 0, 0}, 3},
    {"suspended 4th", "sus4", {0, 5, 7, 0, 0, 0}, 3},
    {"dominant 7th", "7", {0, 4, 7, 10, 0, 0}, 4},
    {"major 7th", "maj7", {0, 4, 7, 11, 0, 0}, 4},
    {"minor 7th", "m7", {0, 3, 7, 10, 0, 0}, 4},
    {"minor major 7th", "mMaj7", {0, 3, 7, 11, 0, 0}, 4},
    {"diminished 7th", "dim7", {0, 3, 6, 9, 0, 0}, 4},
    {"half-diminished 7th", "m7b5", {0, 3, 6, 10, 0, 0}, 4},
    {"augmented 7th", "aug7", {0, 4, 8, 10, 0, 0}, 4},
    {"add 9", "add9", {0, 4, 7, 14, 0, 0}, 4},
    {"minor add 9", "madd9", {0, 3, 7, 14, 0, 0}, 4},
    {"dominant 9th", "9", {0, 4, 7, 10, 14, 0}, 5},
    {"major 9th", "maj9", {0, 4, 7, 11, 14, 0}, 5},
    {"minor 9th", "m9", {0, 3, 7, 10, 14, 0}, 5},
    {"dominant 7th flat 9", "7b9", {0, 4, 7, 10, 13, 0}, 5},
    {"dominant 7th sharp 9", "7#9", {0, 4, 7, 10, 15, 0}, 5},
    {"dominant 7th flat 13", "7b13", {0, 4, 7, 10, 20, 0}, 5},
    {"dominant 7th sharp 11", "7#11", {0, 4, 7, 10, 18, 0}, 5},
    {"dominant 11th", "11", {0, 4, 7, 10, 14, 17}, 6},
    {"dominant 13th", "13", {0, 4, 7, 10, 14, 21}, 6},
    {"major 6th", "6", {0, 4, 7, 9, 0, 0}, 4},
    {"minor 6th", "m6", {0, 3, 7, 9, 0, 0}, 4},
    {"6/9", "6/9", {0, 4, 7, 9, 14, 0}, 5},
    {"power chord", "5", {0, 7, 0, 0, 0, 0}, 2},
};

struct SuffixAlias {
  const char* suffix;
  ChordType type;
};

// Accepted spellings for each quality. UTF-8 escapes: ° ˚ º Δ ø.
constexpr SuffixAlias SUFFIX_ALIASES[] = {
    {"", ChordType::Major},
    {"M", ChordType::Major},
    {"maj", ChordType::Major},
    {"Maj", ChordType::Major},
    {"MAJ", ChordType::Major},
    {"m", ChordType::Minor},
    {"min", ChordType::Minor},
    {"Min", ChordType::Minor},
    {"MIN", ChordType::Minor},
    {"-", ChordType::Minor},
    {"dim", ChordType::Diminished},
    {"Dim", ChordType::Diminished},
    {"DIM", ChordType::Diminished},
    {"\xC2\xB0", ChordType::Diminished},
    {"\xCB\x9A", ChordType::Diminished},
    {"\xC2\xBA", ChordType::Diminished},
    {"aug", ChordType::Augmented},
    {"Aug", ChordType::Augmented},
    {"AUG", ChordType::Augmented},
    {"+", ChordType::Augmented},
    {"sus2", ChordType::Sus2},
    {"Sus2", ChordType::Sus2},
    {"SUS2", ChordType::Sus2},
    {"sus4", ChordType::Sus4},
    {"Sus4", ChordType::Sus4},
    {"SUS4", ChordType::Sus4},
    {"sus", ChordType::Sus4},
    {"Sus", ChordType::Sus4},
    {"SUS", ChordType::Sus4},
    {"7", ChordType::Dominant7},
    {"M7", ChordType::Major7},
    {"maj7", ChordType::Major7},
    {"Maj7", ChordType::Major7},
    {"MAJ7", ChordType::Major7},
    {"\xCE\x94", ChordType::Major7},
    {"\xCE\x94" "7", ChordType::Major7},
    {"m7", ChordType::Minor7},
    {"min7", ChordType::Minor7},
    {"Min7", ChordType::Minor7},
    {"MIN7", ChordType::Minor7},
    {"mM7", ChordType::MinorMajor7},
    {"mMaj7", ChordType::MinorMajor7},
    {"mmaj7", ChordType::MinorMajor7},
    {"minMaj7", ChordType::MinorMajor7},
    {"minM7", ChordType::MinorMajor7},
    {"dim7", ChordType::Diminished7},
    {"Dim7", ChordType::Diminished7},
    {"DIM7", ChordType::Diminished7},
    {"\xC2\xB0" "7", ChordType::Diminished7},
    {"\xCB\x9A" "7", ChordType::Diminished7},
    {"\xC2\xBA" "7", ChordType::Diminished7},
    {"m7b5", ChordType::HalfDiminished7},
    {"min7b5", ChordType::HalfDiminished7},
    {"\xC3\xB8", ChordType::HalfDiminished7},
    {"\xC3\xB8" "7", ChordType::HalfDiminished7},
    {"aug7", ChordType::Augmented7},
    {"Aug7", ChordType::Augmented7},
    {"AUG7", ChordType::Augmented7},
    {"+7", ChordType::Augmented7},
    {"add9", ChordType::Add9},
    {"Add9", ChordType::Add9},
    {"ADD9", ChordType::Add9},
    {"madd9", ChordType::MinorAdd9},
    {"mAdd9", ChordType::MinorAdd9},
    {"minadd9", ChordType::MinorAdd9},
    {"minAdd9", ChordType::MinorAdd9},
    {"9", ChordType::Dominant9},
    {"M9", ChordType::Major9},
    {"maj9", ChordType::Major9},
    {"Maj9", ChordType::Major9},
    {"MAJ9", ChordType::Major9},
    {"m9", ChordType::Minor9},
    {"min9", ChordType::Minor9},
    {"Min9", ChordType::Minor9},
    {"MIN9", ChordType::Minor9},
    {"7b9", ChordType::Dominant7Flat9},
    {"7#9", ChordType::Dominant7Sharp9},
    {"7b13", ChordType::Dominant7Flat13},
    {"7#11", ChordType::Dominant7Sharp11},
    {"11", ChordType::Dominant11},
    {"13", ChordType::Dominant13},
    {"6", ChordType::Major6},
    {"m6", ChordType::Minor6},
    {"min6", ChordType::Minor6},
    {"Min6", ChordType::Minor6},
    {"MIN6", ChordType::Minor6},
    {"69", ChordType::SixNine},
    {"6/9", ChordType::SixNine},
    {"5", ChordType::Power},
};

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

// Rewrites "(5-)" to "(b5)" and "(9+)" to "(#9)".
std::string normalizeAlterationSigns(const std::string& suffix) {
  std::string result;
  size_t i = 0;
  while (i < suffix.size()) {
    if (suffix[i] == '(') {
      size_t j = i + 1;
      while (j < suffix.size() && std::isdigit(static_cast<unsigned char>(suffix[j]))) ++j;
      if (j > i + 1 && j + 1 < suffix.size() && suffix[j + 1] == ')' &&
          (suffix[j] == '-' || suffix[j] == '+')) {
        result += '(';
        result += (suffix[j] == '-') ? 'b' : '#';
        result += suffix.substr(i + 1, j - i - 1);
        result += ')';
        i = j + 2;
        continue;
      }
    }
    result += suffix[i];
    ++i;
  }
  return result;
}

std::string normalizeSuffix(const std::string& raw) {
  std::string suffix = normalizeAlterationSigns(raw);

  // "7M" is shorthand for M7, but leave "mmaj7"-style spellings alone.
  size_t seven_m = suffix.find("7M");
  if (seven_m != std::string::npos && suffix.find("maj") == std::string::npos) {
    suffix.replace(seven_m, 2, "M7");
  }

  std::string stripped;
  stripped.reserve(suffix.size());
  for (char c : suffix) {
    if (c != '(' && c != ')') stripped += c;
  }
  return stripped;
}

// Index of the last '/' outside parentheses, or npos.
size_t findBassSlash(const std::string& text) {
  int paren_depth = 0;
  for (size_t i = text.size(); i > 0; --i) {
    char c = text[i - 1];
    if (c == ')') {
      ++paren_depth;
    } else if (c == '(') {
      --paren_depth;
    } else if (c == '/' && paren_depth == 0) {
      return i - 1;
    }
  }
  return std::string::npos;
}

}  // namespace

const ChordTypeInfo& getChordTypeInfo(ChordType type) {
  return CHORD_TYPES[static_cast<uint8_t>(type)];
}

std::vector<int> Chord::intervals() const {
  const ChordTypeInfo& info = getChordTypeInfo(type);
  std::vector<int> result;
  result.reserve(info.interval_count);
  for (uint8_t i = 0; i < info.interval_count; ++i) {
    result.push_back(info.intervals[i]);
  }
  return result;
}

std::vector<PitchClass> Chord::pitchClasses() const {
  std::vector<PitchClass> result;
  for (int interval : intervals()) {
    result.push_back(transposePitchClass(root, interval));
  }
  return result;
}

Chord Chord::transpose(int semitones) const {
  std::optional<PitchClass> new_bass;
  if (bass) new_bass = transposePitchClass(*bass, semitones);
  return Chord(transposePitchClass(root, semitones), type, new_bass);
}

std::string Chord::symbol() const {
  std::string result = std::string(pitchClassName(root)) + getChordTypeInfo(type).symbol;
  if (bass) {
    result += "/";
    result += pitchClassName(*bass);
  }
  return result;
}

std::string Chord::name() const {
  std::string result = std::string(pitchClassName(root)) + " " + getChordTypeInfo(type).name;
  if (bass) {
    result += " over ";
    result += pitchClassName(*bass);
  }
  return result;
}

std::optional<ChordType> parseChordType(const std::string& suffix) {
  for (const auto& alias : SUFFIX_ALIASES) {
    if (suffix == alias.suffix) return alias.type;
  }
  return std::nullopt;
}

std::optional<Chord> parseChord(const std::string& text) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) return std::nullopt;

  std::optional<PitchClass> bass;
  std::string chord_part = trimmed;

  size_t slash = findBassSlash(trimmed);
  if (slash != std::string::npos && slash > 0) {
    // Not a note name after the slash (e.g. 6/9): keep it in the suffix.
    auto parsed_bass = parsePitchClass(trimmed.substr(slash + 1));
    if (parsed_bass) {
      bass = parsed_bass;
      chord_part = trimmed.substr(0, slash);
    }
  }

  size_t root_len = 1;
  if (chord_part.size() > 1 && (chord_part[1] == '#' || chord_part[1] == 'b')) {
    root_len = 2;
  }
  auto root = parsePitchClass(chord_part.substr(0, root_len));
  if (!root) return std::nullopt;

  auto type = parseChordType(normalizeSuffix(chord_part.substr(root_len)));
  if (!type) return std::nullopt;

  return Chord(*root, *type, bass);
}

}  // namespace fretvoice
