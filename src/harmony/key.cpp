// Implementation of key signature parsing and circle-of-fifths utilities.

#include "harmony/key.h"

#include <cstring>

#include "core/text_utils.h"

namespace mtext {

namespace {

/// Circle-of-fifths position of each natural letter as a major tonic (C=0 .. B=6).
constexpr int kLetterFifths[7] = {0, 2, 4, -1, 1, 3, 5};

/// Letters in the order sharps are added: F C G D A E B.
constexpr int kSharpOrder[7] = {3, 0, 4, 1, 5, 2, 6};

/// Letters in the order flats are added: B E A D G C F.
constexpr int kFlatOrder[7] = {6, 2, 5, 1, 4, 0, 3};

constexpr const char* kLetterNames = "CDEFGAB";

/// @brief Consume one accidental token at pos.
/// @return Alteration (+1 / -1) or 0 if none was present.
int consumeAccidental(const std::string& text, size_t& pos) {
  if (pos >= text.size()) return 0;
  if (text[pos] == '#' || text[pos] == 's') {
    ++pos;
    return 1;
  }
  if (text[pos] == 'b') {
    ++pos;
    return -1;
  }
  if (text.compare(pos, 3, "\xE2\x99\xAF") == 0) {  // ♯
    pos += 3;
    return 1;
  }
  if (text.compare(pos, 3, "\xE2\x99\xAD") == 0) {  // ♭
    pos += 3;
    return -1;
  }
  return 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// Key relationship functions
// ---------------------------------------------------------------------------

KeySignature getRelative(const KeySignature& key_sig) {
  int step = degreeStep(key_sig.tonic);
  int semitone = tonicSemitone(key_sig);
  // Relative major: a minor third up, two letters up. Relative minor: the reverse.
  int new_step = key_sig.is_minor ? (step + 2) % 7 : (step + 5) % 7;
  int target = key_sig.is_minor ? semitone + 3 : semitone - 3;
  int alteration = target - kMajorScaleSemitones[new_step];
  while (alteration > 6) alteration -= 12;
  while (alteration < -6) alteration += 12;
  return {makeDegree(new_step, alteration), !key_sig.is_minor};
}

// ---------------------------------------------------------------------------
// Circle of fifths
// ---------------------------------------------------------------------------

int circleOfFifthsPosition(const KeySignature& key_sig) {
  KeySignature major = key_sig.is_minor ? getRelative(key_sig) : key_sig;
  // Each sharp on the tonic moves seven steps clockwise.
  return kLetterFifths[degreeStep(major.tonic)] + 7 * degreeAlteration(major.tonic);
}

KeyAlterations keySignatureAlterations(const KeySignature& key_sig) {
  KeyAlterations result = {0, 0, 0, 0, 0, 0, 0};
  int position = circleOfFifthsPosition(key_sig);
  for (int idx = 0; idx < position; ++idx) {
    ++result[kSharpOrder[idx % 7]];
  }
  for (int idx = 0; idx < -position; ++idx) {
    --result[kFlatOrder[idx % 7]];
  }
  return result;
}

int tonicSemitone(const KeySignature& key_sig) {
  return degreeSemitone(key_sig.tonic);
}

// ---------------------------------------------------------------------------
// String utilities
// ---------------------------------------------------------------------------

bool keySignatureFromString(const std::string& str, KeySignature& out) {
  std::string lower = toLower(trim(str));
  if (lower.empty()) return false;

  static const char kLetters[] = "cdefgab";
  const char* letter = std::strchr(kLetters, lower[0]);
  if (letter == nullptr) return false;
  int step = static_cast<int>(letter - kLetters);

  size_t pos = 1;
  int alteration = consumeAccidental(lower, pos);
  // A second sign of the same direction makes a double accidental ("bbb" is Bbb).
  if (alteration != 0) {
    size_t probe = pos;
    int second = consumeAccidental(lower, probe);
    if (second == alteration) {
      alteration += second;
      pos = probe;
    }
  }

  std::string mode = trim(lower.substr(pos));
  if (!mode.empty() && mode[0] == '_') mode = mode.substr(1);

  bool is_minor = false;
  if (mode.empty() || mode == "major" || mode == "maj") {
    is_minor = false;
  } else if (mode == "m" || mode == "min" || mode == "minor") {
    is_minor = true;
  } else {
    return false;
  }

  out.tonic = makeDegree(step, alteration);
  out.is_minor = is_minor;
  return true;
}

std::string tonicToString(Degree tonic) {
  std::string result(1, kLetterNames[degreeStep(tonic)]);
  int alteration = degreeAlteration(tonic);
  for (int idx = 0; idx < alteration; ++idx) result += '#';
  for (int idx = 0; idx < -alteration; ++idx) result += 'b';
  return result;
}

std::string keySignatureToString(const KeySignature& key_sig) {
  std::string result = tonicToString(key_sig.tonic);
  result += key_sig.is_minor ? "_minor" : "_major";
  return result;
}

}  // namespace mtext
