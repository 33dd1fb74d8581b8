#ifndef SOLVER_H
#define SOLVER_H

#include <cstdint>
#include "SudokuPuzzle.hpp"

// =========================================================
// Propagation engine
// =========================================================

// Runs the control loop until the puzzle is solved or a budget guard trips,
// then verifies a solved grid. A zero in either parameter selects its
// default. Stalls are returned, not thrown; InternalConsistencyError
// (ConflictError included) signals an engine defect.
SolveState solve(SudokuPuzzle &puzzle, const SolveParameters &params = SolveParameters());

// Throws ConflictError on the first cell (ascending) that is unfilled or
// whose value repeats in its box, column or row.
void verifySolution(const SudokuPuzzle &puzzle);

// The termination check, consulted after every check. Logs the terminal
// action the first time it answers false.
bool okayToKeepTrying(SudokuPuzzle &puzzle);

// Runs the fixed rule sequence for one cell.
void checkCell(SudokuPuzzle &puzzle, Index idx);

// Peer elimination: drop the values of the cell's filled peers in one area.
void checkCellAgainstArea(SudokuPuzzle &puzzle, Index idx, Area area);

// Sole candidate location: fill the cell with a digit no other cell of the
// area can hold.
void checkOnlyPossibilityInArea(SudokuPuzzle &puzzle, Index idx, Area area);

// =========================================================
// Flat API
// =========================================================

extern "C"
{
  int sudoprop_solver_full(const char *in81, char *out81, uint32_t maxChecks, uint32_t maxChecksWithoutAction);

  int sudoprop_solver_init_board(const char *in81, uint32_t maxChecks, uint32_t maxChecksWithoutAction);

  int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words);

  uint32_t sudoprop_solver_check_count(void);
} // extern "C"

#endif // SOLVER_H
