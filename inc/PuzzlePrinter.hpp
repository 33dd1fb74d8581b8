#ifndef PUZZLE_PRINTER_H
#define PUZZLE_PRINTER_H

#include <string>
#include "SudokuPuzzle.hpp"

// passed explicitly to every render call, never kept globally
struct PrintOptions {
  PrintOptions() : enableColor(false) { }

  explicit PrintOptions(bool enableColor) : enableColor(enableColor) { }

  bool enableColor;
};

// box-drawn 9x9 grid, '?' for unfilled cells
std::string renderGrid(const SudokuPuzzle &puzzle, const PrintOptions &options);

// "Step N: ..." narration of one logged action
std::string describeAction(const SudokuAction &action);

// closing summary: steps spent, and the reason when the solve stalled
std::string describeOutcome(const SudokuPuzzle &puzzle);

#endif // PUZZLE_PRINTER_H
