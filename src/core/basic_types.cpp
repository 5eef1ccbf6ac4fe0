/// @file
/// @brief String conversions for the shared enum types.

#include "core/basic_types.h"

namespace mtext {

const char* notationSystemToString(NotationSystem system) {
  switch (system) {
    case NotationSystem::Number:  return "number";
    case NotationSystem::Western: return "western";
    case NotationSystem::Sargam:  return "sargam";
  }
  return "unknown";
}

const char* roleToString(Role role) {
  switch (role) {
    case Role::Start:  return "start";
    case Role::Middle: return "middle";
    case Role::End:    return "end";
  }
  return "unknown";
}

const char* barlineStyleToString(BarlineStyle style) {
  switch (style) {
    case BarlineStyle::Single:      return "|";
    case BarlineStyle::Double:      return "||";
    case BarlineStyle::Final:       return "|.";
    case BarlineStyle::RepeatStart: return "|:";
    case BarlineStyle::RepeatEnd:   return ":|";
    case BarlineStyle::RepeatBoth:  return ":|:";
  }
  return "|";
}

bool barlineStyleFromString(const std::string& text, BarlineStyle& out) {
  if (text == "|") {
    out = BarlineStyle::Single;
  } else if (text == "||") {
    out = BarlineStyle::Double;
  } else if (text == "|." || text == "|]") {
    out = BarlineStyle::Final;
  } else if (text == "|:") {
    out = BarlineStyle::RepeatStart;
  } else if (text == ":|") {
    out = BarlineStyle::RepeatEnd;
  } else if (text == ":|:" || text == ":||:") {
    out = BarlineStyle::RepeatBoth;
  } else {
    return false;
  }
  return true;
}

const char* ornamentTypeToString(OrnamentType type) {
  switch (type) {
    case OrnamentType::Mordent: return "mordent";
    case OrnamentType::Trill:   return "trill";
    case OrnamentType::Turn:    return "turn";
    case OrnamentType::Grace:   return "grace";
  }
  return "unknown";
}

}  // namespace mtext
