#ifndef SUDOKU_CELL_H
#define SUDOKU_CELL_H

#include <cstddef>
#include <cstdint>
#include "utils.hpp"

enum class CellState : uint8_t {
  Unfilled = 0,  // candidates hold every digit still possible
  Filled = 1     // value is final, candidates == { value }
};

class SudokuCell
{
public:
  SudokuCell();

  void place(Index idx);

  // --- position ---
  Index getIndex() const;

  uint8_t getRow() const;

  uint8_t getColumn() const;

  uint8_t getBox() const;

  bool isGiven() const;

  // --- value ---
  CellState getState() const;

  bool isFilled() const;

  Digit getValue() const;

  void makeGiven(Digit digit);

  void fill(Digit digit);

  // --- candidates ---
  Mask getCandidateMask() const;

  void seedCandidates(Mask mask);

  bool hasCandidate(Digit digit) const;

  size_t countCandidates() const;

  Digit getSingleCandidate() const;

  bool disableCandidate(Digit digit);

private:
  Index     index;
  bool      given;
  CellState state;
  Digit     value;     // meaningful only when Filled
  Mask      candMask;  // meaningful only when Unfilled
};

#endif // SUDOKU_CELL_H
