#include "SudokuAction.hpp"

// =========================================================
// Actions
// =========================================================

SudokuAction::SudokuAction(ActionType type, ActionReason reason, uint32_t step)
  : type(type), reason(reason), step(step) { }

SudokuAction::SudokuAction(ActionType type, ActionReason reason, uint32_t step, Index idx, Digit digit)
  : type(type), reason(reason), step(step), cells(1, idx), candidates(1, digit) { }

ActionType SudokuAction::getType() const {
  return type;
}

ActionReason SudokuAction::getReason() const {
  return reason;
}

uint32_t SudokuAction::getStep() const {
  return step;
}

const std::vector<Index> &SudokuAction::getCells() const {
  return cells;
}

const std::vector<Digit> &SudokuAction::getCandidates() const {
  return candidates;
}

bool SudokuAction::isInference() const {
  return type == ActionType::FillCell ||
         type == ActionType::RemoveCandidates ||
         type == ActionType::IdentifyTuple;
}

bool SudokuAction::isTerminal() const {
  return type == ActionType::QuitMaxChecksExceeded ||
         type == ActionType::QuitMaxChecksWithoutActionExceeded ||
         type == ActionType::PuzzleSolved;
}

ActionReason reasonForArea(Area area) {
  switch (area) {
    case Area::Row:    return ActionReason::RowCheck;
    case Area::Column: return ActionReason::ColumnCheck;
    case Area::Box:    return ActionReason::BoxCheck;
  }
  return ActionReason::RowCheck;
}

const char *actionTypeName(ActionType type) {
  switch (type) {
    case ActionType::NoAction:                           return "no-action";
    case ActionType::FillCell:                           return "fill-cell";
    case ActionType::RemoveCandidates:                   return "remove-candidates";
    case ActionType::IdentifyTuple:                      return "identify-tuple";
    case ActionType::QuitMaxChecksExceeded:              return "quit-max-checks-exceeded";
    case ActionType::QuitMaxChecksWithoutActionExceeded: return "quit-max-checks-without-action-exceeded";
    case ActionType::PuzzleSolved:                       return "puzzle-solved";
  }
  return "unknown";
}

const char *actionReasonName(ActionReason reason) {
  switch (reason) {
    case ActionReason::OnlyCandidate:                  return "only-candidate";
    case ActionReason::RowCheck:                       return "row-check";
    case ActionReason::ColumnCheck:                    return "column-check";
    case ActionReason::BoxCheck:                       return "box-check";
    case ActionReason::RowTupleCheck:                  return "row-tuple-check";
    case ActionReason::ColumnTupleCheck:               return "column-tuple-check";
    case ActionReason::BoxTupleCheck:                  return "box-tuple-check";
    case ActionReason::MaxChecksExceeded:              return "max-checks-exceeded";
    case ActionReason::MaxChecksWithoutActionExceeded: return "max-checks-without-action-exceeded";
    case ActionReason::ErrorDetectedDuplicateValue:    return "error-duplicate-value";
    case ActionReason::ErrorDetectedNoCandidates:      return "error-no-candidates";
    case ActionReason::PuzzleSolved:                   return "puzzle-solved";
  }
  return "unknown";
}
