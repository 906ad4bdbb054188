/**
 * @file cli_main.cpp
 * @brief Command-line interface for voicing search, capo suggestions and sequencing.
 */

#include "fretvoice.h"
#include "core/json_helpers.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace fretvoice;

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " <command> [arguments] [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  voicings <chord>      List playable voicings of a chord\n";
  std::cout << "  capo <chord>...       Rank capo positions for a progression\n";
  std::cout << "  sequence <chord>...   Pick one voicing per chord with minimal movement\n\n";
  std::cout << "Options:\n";
  std::cout << "  --instrument NAME     guitar, bass, ukulele, cavaquinho, banjo,\n";
  std::cout << "                        \"7-string guitar\" (default: guitar)\n";
  std::cout << "  --tuning NAME         Named tuning, e.g. \"Drop D\" (default: standard)\n";
  std::cout << "  --capo N              Capo fret for voicings/sequence (default: 0)\n";
  std::cout << "  --level LEVEL         beginner, intermediate or advanced search preset\n";
  std::cout << "  --config FILE         JSON file with search options\n";
  std::cout << "  --show-config         Print the effective search options as JSON\n";
  std::cout << "  --limit N             Max voicings to list, 0 = all (default: 10)\n";
  std::cout << "  --max-capo N          Highest capo fret to consider (default: 12)\n";
  std::cout << "  --prefer MODE         open, barre or balanced (default: balanced)\n";
  std::cout << "  --json                Output JSON to stdout\n";
  std::cout << "  --version             Print version\n";
  std::cout << "  --help                Show this help message\n";
}

struct CliOptions {
  std::string command;
  std::vector<std::string> chords;
  std::string instrument_name = "guitar";
  std::string tuning_name;
  std::string config_file;
  std::string level;
  int capo = 0;
  int limit = 10;
  int max_capo = 12;
  VoicingPreference preference = VoicingPreference::Balanced;
  bool show_config = false;
  bool json_output = false;
};

// Strict non-negative integer parse; rejects trailing garbage.
bool parseCount(const char* text, int max_value, int& out) {
  char* end = nullptr;
  errno = 0;
  long value = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0') return false;
  if (value < 0 || value > max_value) return false;
  out = static_cast<int>(value);
  return true;
}

bool readFile(const std::string& path, std::string& contents) {
  std::ifstream file(path);
  if (!file) return false;
  std::ostringstream oss;
  oss << file.rdbuf();
  contents = oss.str();
  return true;
}

bool resolveInstrument(const CliOptions& opts, Instrument& instrument) {
  auto preset = Instruments::find(opts.instrument_name);
  if (!preset) {
    std::cerr << "Error: Unknown instrument: " << opts.instrument_name << "\n";
    return false;
  }
  instrument = *preset;

  if (!opts.tuning_name.empty()) {
    auto tuning = findTuning(opts.instrument_name, opts.tuning_name);
    if (!tuning) {
      std::cerr << "Error: Unknown tuning for " << instrument.getName() << ": "
                << opts.tuning_name << "\n";
      return false;
    }
    auto retuned = applyTuning(instrument, *tuning);
    if (!retuned) {
      std::cerr << "Error: Tuning " << tuning->name << " has "
                << static_cast<int>(tuning->getStringCount()) << " strings, "
                << instrument.getName() << " has "
                << static_cast<int>(instrument.getStringCount()) << "\n";
      return false;
    }
    instrument = *retuned;
  }

  instrument = instrument.withCapo(static_cast<uint8_t>(opts.capo));
  return true;
}

bool resolveChords(const CliOptions& opts, std::vector<Chord>& chords) {
  for (const auto& symbol : opts.chords) {
    auto chord = parseChord(symbol);
    if (!chord) {
      std::cerr << "Error: Unrecognised chord: " << symbol << "\n";
      return false;
    }
    chords.push_back(*chord);
  }
  return true;
}

bool resolveSearchOptions(const CliOptions& opts, SearchOptions& options) {
  if (!opts.level.empty()) {
    auto level = parseVoicingDifficulty(opts.level);
    if (!level) {
      std::cerr << "Error: Unknown level: " << opts.level
                << " (use beginner, intermediate or advanced)\n";
      return false;
    }
    options = SearchOptions::forLevel(*level);
  }

  if (!opts.config_file.empty()) {
    std::string contents;
    if (!readFile(opts.config_file, contents)) {
      std::cerr << "Error: Failed to open file: " << opts.config_file << "\n";
      return false;
    }
    json::Parser parser(contents);
    if (!parser.isValid()) {
      std::cerr << "Error: " << opts.config_file << " is not a JSON object\n";
      return false;
    }
    options.readFrom(parser);
  }

  SearchOptionsError error = validateSearchOptions(options);
  if (error != SearchOptionsError::OK) {
    std::cerr << "Error: " << searchOptionsErrorString(error) << "\n";
    return false;
  }
  return true;
}

void writeVoicing(json::Writer& w, const Voicing& voicing) {
  json::ObjectScope obj(w);
  w.write("frets", voicing.toCompactString())
      .write("score", voicing.difficultyScore())
      .write("difficulty", voicingDifficultyToString(voicing.difficulty()))
      .write("fingers", static_cast<int>(voicing.fingersRequired()))
      .write("lowest_fret", static_cast<int>(voicing.lowestFret().value_or(0)))
      .write("span", static_cast<int>(voicing.fretSpan()));
}

// ============================================================================
// Commands
// ============================================================================

int runVoicings(const CliOptions& opts) {
  if (opts.chords.size() != 1) {
    std::cerr << "Error: voicings takes exactly one chord\n";
    return 1;
  }

  std::vector<Chord> chords;
  Instrument instrument;
  SearchOptions options;
  if (!resolveChords(opts, chords) || !resolveInstrument(opts, instrument) ||
      !resolveSearchOptions(opts, options)) {
    return 1;
  }

  if (opts.show_config) {
    json::Writer w(std::cout, true);
    w.beginObject();
    options.writeTo(w);
    w.endObject();
    std::cout << "\n";
    return 0;
  }

  VoicingSearch search(instrument, options);
  auto voicings = opts.limit > 0 ? search.findEasiestVoicings(chords[0], opts.limit)
                                 : search.findVoicings(chords[0]);

  if (opts.json_output) {
    json::Writer w(std::cout);
    {
      json::ObjectScope root(w);
      w.write("chord", chords[0].symbol())
          .write("instrument", instrument.getName())
          .write("capo", static_cast<int>(instrument.getCapo()));
      json::ArrayScope arr(w, "voicings");
      for (const auto& voicing : voicings) writeVoicing(w, voicing);
    }
    std::cout << "\n";
    return 0;
  }

  std::cout << chords[0].symbol() << " (" << chords[0].name() << ") on "
            << instrument.toString() << "\n\n";
  if (voicings.empty()) {
    std::cout << "No playable voicings found.\n";
    return 0;
  }
  for (const auto& voicing : voicings) {
    std::cout << "  " << std::left << std::setw(14) << voicing.toCompactString() << std::right
              << " score " << std::setw(3) << voicing.difficultyScore() << "  "
              << std::left << std::setw(12) << voicingDifficultyToString(voicing.difficulty())
              << std::right << " fingers " << static_cast<int>(voicing.fingersRequired())
              << "\n";
  }
  return 0;
}

int runCapo(const CliOptions& opts) {
  if (opts.chords.empty()) {
    std::cerr << "Error: capo needs at least one chord\n";
    return 1;
  }

  std::vector<Chord> chords;
  Instrument instrument;
  if (!resolveChords(opts, chords) || !resolveInstrument(opts, instrument)) return 1;

  CapoSuggester suggester(instrument, static_cast<uint8_t>(opts.max_capo));
  auto suggestions = suggester.suggest(chords);

  if (opts.json_output) {
    json::Writer w(std::cout);
    {
      json::ArrayScope root(w);
      for (const auto& suggestion : suggestions) {
        json::ObjectScope obj(w);
        w.write("capo", static_cast<int>(suggestion.capo_fret))
            .write("score", suggestion.difficulty_score)
            .write("description", suggestion.description());
        json::ArrayScope shapes(w, "shapes");
        for (const auto& symbol : suggestion.shapeSymbols()) w.value(symbol);
      }
    }
    std::cout << "\n";
    return 0;
  }

  size_t shown = opts.limit > 0 ? std::min<size_t>(opts.limit, suggestions.size())
                                : suggestions.size();
  for (size_t i = 0; i < shown; ++i) {
    std::cout << "  " << std::fixed << std::setprecision(1) << std::setw(5)
              << suggestions[i].difficulty_score << "  " << suggestions[i].description() << "\n";
  }
  return 0;
}

int runSequence(const CliOptions& opts) {
  if (opts.chords.empty()) {
    std::cerr << "Error: sequence needs at least one chord\n";
    return 1;
  }

  std::vector<Chord> chords;
  Instrument instrument;
  SearchOptions options;
  if (!resolveChords(opts, chords) || !resolveInstrument(opts, instrument) ||
      !resolveSearchOptions(opts, options)) {
    return 1;
  }

  VoicingSearch search(instrument, options);
  std::vector<std::vector<Voicing>> candidates;
  candidates.reserve(chords.size());
  for (const auto& chord : chords) {
    candidates.push_back(opts.limit > 0 ? search.findEasiestVoicings(chord, opts.limit)
                                        : search.findVoicings(chord));
  }

  auto plan = planProgression(candidates, opts.preference);

  if (opts.json_output) {
    json::Writer w(std::cout);
    {
      json::ArrayScope root(w);
      const Voicing* previous = nullptr;
      for (size_t i = 0; i < plan.size(); ++i) {
        json::ObjectScope obj(w);
        w.write("chord", chords[i].symbol());
        if (!plan[i]) {
          w.writeNull("voicing");
          previous = nullptr;
          continue;
        }
        int cost = transitionCost(previous, &plan[i]->voicing);
        w.write("voicing", plan[i]->voicing.toCompactString())
            .write("candidate_index", plan[i]->original_index)
            .write("transition_cost", cost)
            .write("transition", transitionDifficultyToString(categorizeCost(cost)));
        previous = &plan[i]->voicing;
      }
    }
    std::cout << "\n";
    return 0;
  }

  std::cout << "Preference: " << voicingPreferenceToString(opts.preference) << "\n\n";
  const Voicing* previous = nullptr;
  for (size_t i = 0; i < plan.size(); ++i) {
    std::cout << "  " << std::left << std::setw(8) << chords[i].symbol() << std::right;
    if (!plan[i]) {
      std::cout << "no playable voicing\n";
      previous = nullptr;
      continue;
    }
    int cost = transitionCost(previous, &plan[i]->voicing);
    std::cout << std::left << std::setw(14) << plan[i]->voicing.toCompactString() << std::right;
    if (previous) {
      std::cout << " move " << std::setw(3) << cost << " ("
                << transitionDifficultyToString(categorizeCost(cost)) << ")";
    }
    std::cout << "\n";
    previous = &plan[i]->voicing;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(argv[i], "--version") == 0) {
      std::cout << "fretvoice v" << fretvoice::version() << "\n";
      return 0;
    } else if (std::strcmp(argv[i], "--instrument") == 0 && i + 1 < argc) {
      opts.instrument_name = argv[++i];
    } else if (std::strcmp(argv[i], "--tuning") == 0 && i + 1 < argc) {
      opts.tuning_name = argv[++i];
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      opts.config_file = argv[++i];
    } else if (std::strcmp(argv[i], "--level") == 0 && i + 1 < argc) {
      opts.level = argv[++i];
    } else if (std::strcmp(argv[i], "--capo") == 0 && i + 1 < argc) {
      if (!parseCount(argv[++i], fretvoice::kMaxFrets, opts.capo)) {
        std::cerr << "Invalid capo: " << argv[i] << " (use 0-"
                  << static_cast<int>(fretvoice::kMaxFrets) << ")\n";
        return 1;
      }
    } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
      if (!parseCount(argv[++i], 100000, opts.limit)) {
        std::cerr << "Invalid limit: " << argv[i] << "\n";
        return 1;
      }
    } else if (std::strcmp(argv[i], "--max-capo") == 0 && i + 1 < argc) {
      if (!parseCount(argv[++i], fretvoice::kMaxFrets, opts.max_capo)) {
        std::cerr << "Invalid max capo: " << argv[i] << " (use 0-"
                  << static_cast<int>(fretvoice::kMaxFrets) << ")\n";
        return 1;
      }
    } else if (std::strcmp(argv[i], "--prefer") == 0 && i + 1 < argc) {
      auto preference = fretvoice::parseVoicingPreference(argv[++i]);
      if (!preference) {
        std::cerr << "Unknown preference: " << argv[i] << " (use open, barre or balanced)\n";
        return 1;
      }
      opts.preference = *preference;
    } else if (std::strcmp(argv[i], "--show-config") == 0) {
      opts.show_config = true;
    } else if (std::strcmp(argv[i], "--json") == 0) {
      opts.json_output = true;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      return 1;
    } else if (opts.command.empty()) {
      opts.command = argv[i];
    } else {
      opts.chords.push_back(argv[i]);
    }
  }

  if (opts.command == "voicings") return runVoicings(opts);
  if (opts.command == "capo") return runCapo(opts);
  if (opts.command == "sequence") return runSequence(opts);

  if (!opts.command.empty()) std::cerr << "Unknown command: " << opts.command << "\n\n";
  printUsage(argv[0]);
  return 1;
}
