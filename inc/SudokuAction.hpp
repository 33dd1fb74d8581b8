#ifndef SUDOKU_ACTION_H
#define SUDOKU_ACTION_H

#include <cstdint>
#include <vector>
#include "utils.hpp"

enum class ActionType : uint8_t {
  NoAction = 0,
  FillCell = 1,
  RemoveCandidates = 2,
  IdentifyTuple = 3,  // reserved, never emitted
  QuitMaxChecksExceeded = 4,
  QuitMaxChecksWithoutActionExceeded = 5,
  PuzzleSolved = 6
};

enum class ActionReason : uint8_t {
  OnlyCandidate = 0,
  RowCheck = 1,     // row mates eliminate the candidate, or only cell in the row for it
  ColumnCheck = 2,  // same, for the column
  BoxCheck = 3,     // same, for the box
  RowTupleCheck = 4,     // reserved
  ColumnTupleCheck = 5,  // reserved
  BoxTupleCheck = 6,     // reserved
  MaxChecksExceeded = 7,
  MaxChecksWithoutActionExceeded = 8,
  ErrorDetectedDuplicateValue = 9,  // reserved
  ErrorDetectedNoCandidates = 10,   // reserved
  PuzzleSolved = 11
};

// one entry of the puzzle's action log, never mutated once logged
class SudokuAction
{
public:
  SudokuAction(ActionType type, ActionReason reason, uint32_t step);

  SudokuAction(ActionType type, ActionReason reason, uint32_t step, Index idx, Digit digit);

  ActionType getType() const;

  ActionReason getReason() const;

  // value of the check counter when the action was logged
  uint32_t getStep() const;

  const std::vector<Index> &getCells() const;

  const std::vector<Digit> &getCandidates() const;

  bool isInference() const;

  bool isTerminal() const;

private:
  ActionType type;
  ActionReason reason;
  uint32_t step;
  std::vector<Index> cells;       // empty for puzzle-level events
  std::vector<Digit> candidates;
};

ActionReason reasonForArea(Area area);

const char *actionTypeName(ActionType type);

const char *actionReasonName(ActionReason reason);

#endif // SUDOKU_ACTION_H
