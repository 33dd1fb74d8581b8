#ifndef SUDOKU_PUZZLE_H
#define SUDOKU_PUZZLE_H

#include <cstdint>
#include <string>
#include <vector>
#include "SudokuAction.hpp"
#include "SudokuCell.hpp"

enum class CellFilter : uint8_t {
  AllCells = 0,
  FilledCells = 1,
  UnfilledCells = 2
};

enum class SolveState : uint8_t {
  Running = 0,
  Solved = 1,
  StalledBudget = 2,
  StalledStagnation = 3
};

static constexpr uint32_t DEFAULT_MAX_CHECKS = 10000;
static constexpr uint32_t DEFAULT_MAX_CHECKS_WITHOUT_ACTION = 500;

struct SolveParameters {
  SolveParameters()
    : maxChecks(DEFAULT_MAX_CHECKS), maxChecksWithoutAction(DEFAULT_MAX_CHECKS_WITHOUT_ACTION) { }

  SolveParameters(uint32_t maxChecks, uint32_t maxChecksWithoutAction)
    : maxChecks(maxChecks), maxChecksWithoutAction(maxChecksWithoutAction) { }

  uint32_t maxChecks;               // total effort budget
  uint32_t maxChecksWithoutAction;  // stagnation guard
};

class SudokuPuzzle
{
public:
  // 9x9 grid, 0 = empty, 1..9 = given; throws ConstructionError
  static SudokuPuzzle fromGrid(const std::vector<std::vector<int>> &grid);

  // 81 symbols, digits 1..9 are givens, 0 or '.' are empty, whitespace is
  // ignored; throws ConstructionError
  static SudokuPuzzle fromString(const std::string &values);

  // --- cells API ---
  const SudokuCell &cell(Index idx) const;

  Digit getValue(Index idx) const;

  bool isFilled(Index idx) const;

  bool hasCandidate(Index idx, Digit digit) const;

  size_t countUnfilled() const;

  bool isCompletelySolved() const;

  const Index *boxCells(int box) const;

  // --- peer queries (read-only, ascending index order) ---
  std::vector<Index> cellsInArea(Area area, int areaIndex, CellFilter filter,
                                 Index excludeIdx = NO_INDEX) const;

  std::vector<Index> cellsInRow(int row, CellFilter filter, Index excludeIdx = NO_INDEX) const;

  std::vector<Index> cellsInColumn(int column, CellFilter filter, Index excludeIdx = NO_INDEX) const;

  std::vector<Index> cellsInBox(int box, CellFilter filter, Index excludeIdx = NO_INDEX) const;

  std::vector<Index> unfilledCells() const;

  // --- solve bookkeeping ---
  const std::vector<SudokuAction> &getActions() const;

  uint32_t getCheckCounter() const;

  bool hasCheckWithAction() const;

  // only meaningful when hasCheckWithAction()
  uint32_t getLastCheckWithAction() const;

  // checks performed since the last inference (or since the start)
  uint32_t getChecksWithoutAction() const;

  const SolveParameters &getSolveParameters() const;

  void setSolveParameters(const SolveParameters &params);

  SolveState getState() const;

  // row-major, '0' for unfilled cells, always 81 characters
  std::string solutionString() const;

  // --- events API (engine only) ---
  void countCheck();

  // removes and logs one candidate; fills the cell with OnlyCandidate when
  // a single digit is left. Returns false if the digit was not a candidate.
  bool applyRemoveCandidate(Index idx, Digit digit, ActionReason reason);

  void applyFill(Index idx, Digit digit, ActionReason reason);

  void autoClearPeersAfterPlacement(Index idx, Digit digit);

  void finish(SolveState state, ActionType type, ActionReason reason);

private:
  SudokuPuzzle();

  void logAction(const SudokuAction &action);

  void initializeCandidates();

  SudokuCell cells[81];
  Index boxes[9][9];

  uint32_t checkCounter;
  bool checkWithAction;
  uint32_t lastCheckWithAction;
  std::vector<SudokuAction> actions;
  SolveParameters solveParameters;
  SolveState state;
  size_t unfilled;
};

#endif // SUDOKU_PUZZLE_H
