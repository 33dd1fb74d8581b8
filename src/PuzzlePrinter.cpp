#include "PuzzlePrinter.hpp"

#include <iterator>

#include <fmt/color.h>
#include <fmt/format.h>

// =========================================================
// Grid
// =========================================================

static const char *const TOP_BORDER    = "┌───────┬───────┬───────┐\n";
static const char *const MIDDLE_BORDER = "├───────┼───────┼───────┤\n";
static const char *const BOTTOM_BORDER = "└───────┴───────┴───────┘\n";

static std::string renderCell(const SudokuCell &cell, const PrintOptions &options) {
  if (!cell.isFilled()) {
    if (options.enableColor) {
      return fmt::format(fmt::fg(fmt::terminal_color::bright_black), "?");
    }
    return "?";
  }

  const int value = cell.getValue();
  if (!options.enableColor) {
    return fmt::format("{}", value);
  }
  if (cell.isGiven()) {
    return fmt::format(fmt::text_style(fmt::emphasis::bold), "{}", value);
  }
  return fmt::format(fmt::fg(fmt::terminal_color::green), "{}", value);
}

std::string renderGrid(const SudokuPuzzle &puzzle, const PrintOptions &options) {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{}", TOP_BORDER);
  for (int r = 0; r < 9; r++) {
    if (r == 3 || r == 6) {
      fmt::format_to(it, "{}", MIDDLE_BORDER);
    }
    for (int c = 0; c < 9; c++) {
      fmt::format_to(it, "{}{}", (c % 3 == 0) ? "│ " : "", renderCell(puzzle.cell(ROW_CELLS[r][c]), options));
      fmt::format_to(it, " ");
    }
    fmt::format_to(it, "│\n");
  }
  fmt::format_to(it, "{}", BOTTOM_BORDER);

  return fmt::to_string(out);
}

// =========================================================
// Narration
// =========================================================

static std::string fillReasonText(ActionReason reason) {
  switch (reason) {
    case ActionReason::OnlyCandidate: return "cell had only one candidate";
    case ActionReason::RowCheck:      return "no other cell in the row can hold it";
    case ActionReason::ColumnCheck:   return "no other cell in the column can hold it";
    case ActionReason::BoxCheck:      return "no other cell in the box can hold it";
    default:                          return fmt::format("of {}", actionReasonName(reason));
  }
}

static std::string removeReasonText(ActionReason reason) {
  switch (reason) {
    case ActionReason::RowCheck:    return "a cell in the same row holds it";
    case ActionReason::ColumnCheck: return "a cell in the same column holds it";
    case ActionReason::BoxCheck:    return "a cell in the same box holds it";
    default:                        return fmt::format("of {}", actionReasonName(reason));
  }
}

std::string describeAction(const SudokuAction &action) {
  const Index idx = action.getCells().empty() ? NO_INDEX : action.getCells()[0];
  const int digit = action.getCandidates().empty() ? 0 : action.getCandidates()[0];

  switch (action.getType()) {
    case ActionType::FillCell:
      return fmt::format("Step {}: Filled in cell {} (row {}, column {}) with value {} because {}.",
                         action.getStep(), idx, idxRow(idx) + 1, idxCol(idx) + 1, digit,
                         fillReasonText(action.getReason()));
    case ActionType::RemoveCandidates:
      return fmt::format("Step {}: Removed candidate {} from cell {} (row {}, column {}) because {}.",
                         action.getStep(), digit, idx, idxRow(idx) + 1, idxCol(idx) + 1,
                         removeReasonText(action.getReason()));
    case ActionType::PuzzleSolved:
      return fmt::format("Step {}: Puzzle solved.", action.getStep());
    case ActionType::QuitMaxChecksExceeded:
    case ActionType::QuitMaxChecksWithoutActionExceeded:
      return fmt::format("Step {}: Quit trying ({}).", action.getStep(), actionReasonName(action.getReason()));
    default:
      return fmt::format("Step {}: {} ({}).", action.getStep(),
                         actionTypeName(action.getType()), actionReasonName(action.getReason()));
  }
}

std::string describeOutcome(const SudokuPuzzle &puzzle) {
  const SolveParameters &params = puzzle.getSolveParameters();

  switch (puzzle.getState()) {
    case SolveState::Solved:
      return fmt::format("Solved the puzzle in {} steps!", puzzle.getCheckCounter());
    case SolveState::StalledBudget:
      return fmt::format("Failed to solve the puzzle after {} steps!\n"
                         "Reason for failure: Exceeded maximum number of checks ({})",
                         puzzle.getCheckCounter(), params.maxChecks);
    case SolveState::StalledStagnation:
      return fmt::format("Failed to solve the puzzle after {} steps!\n"
                         "Reason for failure: Exceeded maximum number of checks without any actions ({})",
                         puzzle.getCheckCounter(), params.maxChecksWithoutAction);
    case SolveState::Running:
      break;
  }
  return fmt::format("Puzzle not solved yet after {} steps.", puzzle.getCheckCounter());
}
