#include "SudokuCell.hpp"
#include "SudokuErrors.hpp"
#include <sstream>

// =========================================================
// SudokuCell
// =========================================================

SudokuCell::SudokuCell()
  : index(0), given(false), state(CellState::Unfilled), value(0), candMask(0) { }

void SudokuCell::place(Index idx) {
  index = idx;
}

// --- position ---
Index SudokuCell::getIndex() const {
  return index;
}

uint8_t SudokuCell::getRow() const {
  return idxRow(index);
}

uint8_t SudokuCell::getColumn() const {
  return idxCol(index);
}

uint8_t SudokuCell::getBox() const {
  return idxBox(index);
}

bool SudokuCell::isGiven() const {
  return given;
}

// --- value ---
CellState SudokuCell::getState() const {
  return state;
}

bool SudokuCell::isFilled() const {
  return state == CellState::Filled;
}

Digit SudokuCell::getValue() const {
  return isFilled() ? value : 0;
}

void SudokuCell::makeGiven(Digit digit) {
  fill(digit);
  given = true;
}

void SudokuCell::fill(Digit digit) {
  if (digit < 1 || digit > 9) {
    std::ostringstream oss;
    oss << "Cell " << index << ": cannot fill with digit " << (int)digit;
    throw InternalConsistencyError(oss.str());
  }
  if (isFilled()) {
    std::ostringstream oss;
    oss << "Cell " << index << " (row " << (getRow() + 1) << ", column " << (getColumn() + 1)
        << ") already has a value (" << (int)value << "), cannot fill with " << (int)digit;
    throw InternalConsistencyError(oss.str());
  }
  state = CellState::Filled;
  value = digit;
  candMask = 0;
}

// --- candidates ---
Mask SudokuCell::getCandidateMask() const {
  if (isFilled()) {
    return digitToBit(value);
  }
  return (Mask)(candMask & ALL_DIGITS);
}

void SudokuCell::seedCandidates(Mask mask) {
  if (isFilled()) {
    return;
  }
  candMask = (Mask)(mask & ALL_DIGITS);
}

bool SudokuCell::hasCandidate(Digit digit) const {
  return (getCandidateMask() & digitToBit(digit)) != 0;
}

size_t SudokuCell::countCandidates() const {
  return countBits9(getCandidateMask());
}

Digit SudokuCell::getSingleCandidate() const {
  const Mask m = getCandidateMask();
  if (countBits9(m) == 1) {
    return bitToDigitSingle(m);
  }
  return 0;
}

// candidates only shrink; a filled cell keeps { value } forever
bool SudokuCell::disableCandidate(Digit digit) {
  if (isFilled()) {
    return false;
  }
  const Mask bit = digitToBit(digit);
  const Mask before = getCandidateMask();
  const Mask after = (Mask)(before & ~bit);
  if (after != before) {
    candMask = after;
    return true;
  }
  return false;
}
