/**
 * @file voicing.h
 * @brief Chord voicing: one concrete fingering of a chord on an instrument.
 *
 * A Voicing holds one StringPosition per string (muted, open or fretted)
 * and at most one barre. It is immutable; fret span, finger count and
 * difficulty are computed on demand.
 */

#ifndef FRETVOICE_INSTRUMENT_FRETTED_VOICING_H
#define FRETVOICE_INSTRUMENT_FRETTED_VOICING_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/chord.h"
#include "instrument/fretted/fretted_types.h"
#include "instrument/fretted/instrument.h"

namespace fretvoice {

/// @brief State of a single string in a voicing.
enum class StringState : uint8_t {
  Muted,   ///< Not played [X]
  Open,    ///< Played unfretted [0]
  Fretted  ///< Pressed at fret >= 1
};

/**
 * @brief Position of the fretting hand on one string.
 *
 * Closed variant: muted and open (fret 0) are distinct states, and only a
 * fretted position carries a fret number and optional finger.
 */
class StringPosition {
 public:
  /// @brief Muted string (default).
  StringPosition() : state_(StringState::Muted), fret_(0), finger_(0) {}

  static StringPosition muted() { return StringPosition(); }

  static StringPosition open() { return StringPosition(StringState::Open, 0, 0); }

  /**
   * @brief Fretted string.
   * @param fret Fret number; 0 yields an open string
   * @param finger 1=index, 2=middle, 3=ring, 4=pinky, 0=unspecified
   */
  static StringPosition fretted(uint8_t fret, uint8_t finger = 0) {
    if (fret == 0) return open();
    return StringPosition(StringState::Fretted, fret, finger <= 4 ? finger : 0);
  }

  /// @brief Build from a fret number (negative = muted, 0 = open).
  static StringPosition fromFret(int fret) {
    if (fret < 0) return muted();
    return fretted(static_cast<uint8_t>(fret));
  }

  StringState state() const { return state_; }
  bool isMuted() const { return state_ == StringState::Muted; }
  bool isOpen() const { return state_ == StringState::Open; }
  bool isFretted() const { return state_ == StringState::Fretted; }
  bool isPlayed() const { return state_ != StringState::Muted; }

  /// @brief Fret number; 0 for open. Meaningless when muted.
  uint8_t fret() const { return fret_; }

  /// @brief Assigned finger (1-4), if any.
  std::optional<uint8_t> finger() const {
    if (finger_ == 0) return std::nullopt;
    return finger_;
  }

  bool operator==(const StringPosition& other) const {
    return state_ == other.state_ && fret_ == other.fret_ && finger_ == other.finger_;
  }
  bool operator!=(const StringPosition& other) const { return !(*this == other); }

 private:
  StringPosition(StringState state, uint8_t fret, uint8_t finger)
      : state_(state), fret_(fret), finger_(finger) {}

  StringState state_;
  uint8_t fret_;
  uint8_t finger_;
};

/// @brief One finger pressing a contiguous range of strings at one fret.
struct Barre {
  uint8_t fret;         ///< Barre fret
  uint8_t from_string;  ///< Lowest covered string
  uint8_t to_string;    ///< Highest covered string (inclusive)
  uint8_t finger;       ///< Finger used (usually 1 = index)

  Barre() : fret(1), from_string(0), to_string(0), finger(1) {}
  Barre(uint8_t f, uint8_t from, uint8_t to, uint8_t fing = 1)
      : fret(f), from_string(from), to_string(to), finger(fing) {}

  /// @brief Number of strings covered.
  uint8_t getStringCount() const { return static_cast<uint8_t>(to_string - from_string + 1); }

  bool operator==(const Barre& other) const {
    return fret == other.fret && from_string == other.from_string &&
           to_string == other.to_string && finger == other.finger;
  }
  bool operator!=(const Barre& other) const { return !(*this == other); }
};

/// @brief Difficulty category of a voicing.
enum class VoicingDifficulty : uint8_t {
  Beginner,      ///< Open chords, few frets, no barre
  Intermediate,  ///< Barres or wider stretches
  Advanced       ///< Large stretches, high positions, complex shapes
};

/// @brief Convert VoicingDifficulty to string.
inline const char* voicingDifficultyToString(VoicingDifficulty difficulty) {
  switch (difficulty) {
    case VoicingDifficulty::Beginner: return "beginner";
    case VoicingDifficulty::Intermediate: return "intermediate";
    case VoicingDifficulty::Advanced: return "advanced";
  }
  return "unknown";
}

/// @brief Parse "beginner" / "intermediate" / "advanced".
std::optional<VoicingDifficulty> parseVoicingDifficulty(const std::string& text);

/**
 * @brief A specific way to play a chord on an instrument.
 *
 * ```cpp
 * // Am: X02210
 * auto am = Voicing::fromFrets({-1, 0, 2, 2, 1, 0});
 * am.difficulty();  // Beginner
 * ```
 */
class Voicing {
 public:
  Voicing() = default;

  /// @brief Construct from per-string positions (low to high) and optional barre.
  explicit Voicing(std::vector<StringPosition> positions,
                   std::optional<Barre> barre = std::nullopt);

  /// @brief Build from fret numbers (negative = muted, 0 = open).
  static Voicing fromFrets(const std::vector<int>& frets,
                           std::optional<Barre> barre = std::nullopt);

  const std::vector<StringPosition>& getPositions() const { return positions_; }
  const std::optional<Barre>& getBarre() const { return barre_; }

  uint8_t getStringCount() const { return static_cast<uint8_t>(positions_.size()); }

  uint8_t playedStringCount() const;
  uint8_t mutedStringCount() const;
  uint8_t frettedStringCount() const;
  uint8_t openStringCount() const;

  /// @brief Lowest fretted fret, or std::nullopt if nothing is fretted.
  std::optional<uint8_t> lowestFret() const;

  /// @brief Highest fretted fret, or std::nullopt if nothing is fretted.
  std::optional<uint8_t> highestFret() const;

  /// @brief Highest minus lowest fretted fret (0 with at most one fretted note).
  uint8_t fretSpan() const;

  bool requiresBarre() const { return barre_.has_value(); }

  /// @brief True when no string is fretted.
  bool isAllOpen() const;

  /// @brief Number of muted strings with played strings on both sides.
  uint8_t interiorMuteCount() const;

  bool hasInteriorMute() const { return interiorMuteCount() > 0; }

  /// @brief Estimated fingers needed (see DifficultyModel).
  uint8_t fingersRequired() const;

  /// @brief Difficulty score, lower is easier (see DifficultyModel).
  int difficultyScore() const;

  /// @brief Difficulty category derived from difficultyScore().
  VoicingDifficulty difficulty() const;

  /**
   * @brief Fretted shape: (string, fret) for every fretted string.
   *
   * Open, muted and finger data are ignored. Used to group voicings that
   * share a hand shape.
   */
  std::vector<FretPosition> frettedShape() const;

  /**
   * @brief Sounding pitch classes of played strings, low to high.
   * @return Pitch classes, or std::nullopt if the string counts differ
   */
  std::optional<std::vector<PitchClass>> pitchClassesOn(const Instrument& instrument) const;

  /**
   * @brief Whether this voicing plays the chord on the instrument.
   *
   * True when every sounding note is a chord tone, every chord tone sounds
   * and the root is present. False when the voicing does not fit the
   * instrument.
   */
  bool playsChord(const Chord& chord, const Instrument& instrument) const;

  /// @brief Compact text: X muted, 0 open, frets >= 10 in parentheses ("X0(10)(10)90").
  std::string toCompactString() const;

  bool operator==(const Voicing& other) const {
    return positions_ == other.positions_ && barre_ == other.barre_;
  }
  bool operator!=(const Voicing& other) const { return !(*this == other); }

 private:
  std::vector<StringPosition> positions_;
  std::optional<Barre> barre_;
};

/**
 * @brief Parse a voicing string.
 *
 * Single-character form ("X02210", x/X muted, o/O or 0 open, parenthesised
 * multi-digit frets such as "X0(10)") or delimited form ("X-0-10-10-9-0",
 * space or dash separated).
 *
 * @return Voicing, or std::nullopt for malformed input
 */
std::optional<Voicing> parseVoicing(const std::string& text);

}  // namespace fretvoice

#endif  // FRETVOICE_INSTRUMENT_FRETTED_VOICING_H
