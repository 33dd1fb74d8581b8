#include "SudokuErrors.hpp"
#include <sstream>

static std::string conflictMessage(Index idx, Digit value, Area area, Index peer, Digit peerValue) {
  std::ostringstream oss;
  oss << "Conflict found! Cell " << idx
      << " (row " << (idxRow(idx) + 1) << ", column " << (idxCol(idx) + 1) << ") ";
  if (value == 0) {
    oss << "has no value";
  } else if (peerValue == 0) {
    oss << "shares its " << areaName(area) << " with unfilled cell " << peer;
  } else {
    oss << "has the same value (" << (int)value << ") as cell " << peer
        << " in the same " << areaName(area);
  }
  oss << ".";
  return oss.str();
}

ConflictError::ConflictError(Index idx, Digit value, Area area, Index peer, Digit peerValue)
  : InternalConsistencyError(conflictMessage(idx, value, area, peer, peerValue)),
    idx(idx), digit(value), where(area), other(peer) { }

const char *areaName(Area area) {
  switch (area) {
    case Area::Row:    return "row";
    case Area::Column: return "column";
    case Area::Box:    return "box";
  }
  return "area";
}
