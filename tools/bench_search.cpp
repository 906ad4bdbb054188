/**
 * @file bench_search.cpp
 * @brief Benchmark binary for profiling voicing search.
 *
 * Usage:
 *   ./build/bin/bench_search                       # Every chord x every preset instrument
 *   ./build/bin/bench_search --window 24           # Search frets 0-24
 *   ./build/bin/bench_search --instrument ukulele  # Single instrument
 *   ./build/bin/bench_search --iterations 20       # Repeat each search
 */

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "core/chord.h"
#include "instrument/fretted/instrument.h"
#include "instrument/fretted/voicing_search.h"

using Clock = std::chrono::high_resolution_clock;

struct TimingResult {
  std::string instrument;
  std::string chord;
  double elapsed_ms;
  size_t voicings;
};

namespace {

const char* BENCH_CHORDS[] = {"C",     "Am",  "G7",     "Fmaj7", "Bm7b5", "E9",
                              "Dm9",   "C13", "F#7#9",  "Bbadd9", "C6/9", "Ab/Eb",
                              "Cdim7", "Eaug", "Gsus4", "A5"};

}  // namespace

int main(int argc, char* argv[]) {
  int window = 12;
  int iterations = 5;
  std::string single_instrument;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
      window = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--instrument") == 0 && i + 1 < argc) {
      single_instrument = argv[++i];
    } else if (std::strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
      iterations = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: " << argv[0] << " [options]\n"
                << "  --window N       Fret window end (default: 12)\n"
                << "  --instrument S   Single preset instrument (default: all)\n"
                << "  --iterations N   Searches per chord (default: 5)\n";
      return 0;
    }
  }

  if (window < 0 || window > fretvoice::kMaxFrets || iterations < 1) {
    std::cerr << "Invalid --window or --iterations\n";
    return 1;
  }

  std::vector<fretvoice::Instrument> instruments;
  if (!single_instrument.empty()) {
    auto found = fretvoice::Instruments::find(single_instrument);
    if (!found) {
      std::cerr << "Unknown instrument: " << single_instrument << "\n";
      return 1;
    }
    instruments.push_back(*found);
  } else {
    instruments = fretvoice::Instruments::all();
  }

  std::vector<fretvoice::Chord> chords;
  for (const char* symbol : BENCH_CHORDS) {
    auto chord = fretvoice::parseChord(symbol);
    if (!chord) {
      std::cerr << "Unrecognised chord: " << symbol << "\n";
      return 1;
    }
    chords.push_back(*chord);
  }

  fretvoice::SearchOptions options;
  options.max_fret = static_cast<uint8_t>(window);

  size_t total = instruments.size() * chords.size() * static_cast<size_t>(iterations);
  std::cout << "Benchmark: " << total << " searches (" << chords.size() << " chords x "
            << instruments.size() << " instruments x " << iterations
            << " iterations, frets 0-" << window << ")\n";

  std::vector<TimingResult> results;
  results.reserve(total);
  auto bench_start = Clock::now();

  for (const auto& instrument : instruments) {
    fretvoice::VoicingSearch search(instrument, options);
    for (const auto& chord : chords) {
      for (int it = 0; it < iterations; ++it) {
        auto t0 = Clock::now();
        auto voicings = search.findVoicings(chord);
        auto t1 = Clock::now();

        double elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        results.push_back({instrument.getName(), chord.symbol(), elapsed_ms, voicings.size()});
      }
    }
  }

  auto bench_end = Clock::now();
  double total_ms = std::chrono::duration<double, std::milli>(bench_end - bench_start).count();

  // === Report ===
  std::cout << "\n" << std::string(70, '=') << "\n";
  std::cout << "VOICING SEARCH BENCHMARK RESULTS\n";
  std::cout << std::string(70, '=') << "\n\n";

  std::vector<double> all_times;
  for (const auto& r : results) all_times.push_back(r.elapsed_ms);
  std::sort(all_times.begin(), all_times.end());

  double sum = std::accumulate(all_times.begin(), all_times.end(), 0.0);
  double avg = sum / all_times.size();
  double med = all_times[all_times.size() / 2];

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "  Total wall time:    " << total_ms << " ms\n";
  std::cout << "  Total searches:     " << results.size() << "\n";
  std::cout << "  Throughput:         " << (results.size() / (total_ms / 1000.0))
            << " searches/s\n";
  std::cout << "  Mean:               " << avg << " ms\n";
  std::cout << "  Median:             " << med << " ms\n";
  std::cout << "  Min:                " << all_times.front() << " ms\n";
  std::cout << "  Max:                " << all_times.back() << " ms\n";

  size_t p95_idx = static_cast<size_t>(all_times.size() * 0.95);
  std::cout << "  P95:                " << all_times[p95_idx] << " ms\n";

  // Per-instrument stats
  std::cout << "\n  " << std::left << std::setw(18) << "Instrument" << std::right << std::setw(9)
            << "Mean" << std::setw(9) << "Max" << std::setw(10) << "Voicings" << "\n";
  std::cout << "  " << std::string(46, '-') << "\n";

  for (const auto& instrument : instruments) {
    std::vector<double> times;
    size_t voicings = 0;
    for (const auto& r : results) {
      if (r.instrument != instrument.getName()) continue;
      times.push_back(r.elapsed_ms);
      voicings += r.voicings;
    }
    if (times.empty()) continue;

    double inst_avg = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
    double inst_max = *std::max_element(times.begin(), times.end());
    std::cout << "  " << std::left << std::setw(18) << instrument.getName() << std::right
              << std::setprecision(3) << std::setw(9) << inst_avg << std::setw(9) << inst_max
              << std::setw(10) << voicings / static_cast<size_t>(iterations) << "\n";
  }

  // Slowest 10
  std::sort(results.begin(), results.end(),
            [](const auto& a, const auto& b) { return a.elapsed_ms > b.elapsed_ms; });
  std::cout << "\n  Top 10 slowest:\n";
  for (int i = 0; i < std::min(10, static_cast<int>(results.size())); ++i) {
    const auto& r = results[i];
    std::cout << "    " << std::fixed << std::setprecision(3) << std::setw(8) << r.elapsed_ms
              << "ms  " << r.instrument << " " << r.chord << " voicings=" << r.voicings << "\n";
  }

  std::cout << "\n";
  return 0;
}
