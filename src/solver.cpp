// sudoprop propagation engine (C++)
// Deterministic 9x9 solver built from two rule families: peer elimination
// and sole candidate location. Every inference lands in the puzzle's
// action log; no guessing, no tuples.
//
// Exported functions:
//   int sudoprop_solver_full(const char *in81, char *out81, uint32_t maxChecks, uint32_t maxChecksWithoutAction);
//   int sudoprop_solver_init_board(const char *in81, uint32_t maxChecks, uint32_t maxChecksWithoutAction);
//   int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words);
//   uint32_t sudoprop_solver_check_count(void);
//
// Input string:
//   in81[81]   : char      ('0' or '.' = empty, '1'..'9' = given, whitespace ignored)
//
// Output string (out81[82] as char):
//   out81[81]  : char      ('0' = not solved, '1'..'9' = digit), NUL terminated
//
// Return codes (full / init_board):
//   1 = solved, 2 = stalled on maxChecks, 3 = stalled on maxChecksWithoutAction,
//   0 = malformed input, -1 = internal consistency error
//
// Output buffer (out[5] as uint32_t), one logged action per call:
//   out[0] = type     (ActionType)
//   out[1] = idx      (0..80, 0xFF for puzzle-level actions)
//   out[2] = digit    (1..9, 0 for puzzle-level actions)
//   out[3] = reasonId (ActionReason)
//   out[4] = step     (check counter when the action was logged)
//
// Notes:
//   - sudoprop_solver_next_step replays the log of the last sudoprop_solver_init_board call.
//   - A zero budget selects the default (10000 checks, 500 checks without action).

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <exception>
#include <memory>
#include <string>

#include "solver.hpp"
#include "SudokuErrors.hpp"
#include "utils.hpp"

static std::unique_ptr<SudokuPuzzle> g_puzzle;
static size_t g_replayCursor = 0;

// =========================================================
// Termination policy
// =========================================================

bool okayToKeepTrying(SudokuPuzzle &puzzle) {
  if (puzzle.getState() != SolveState::Running) {
    return false;
  }

  if (puzzle.isCompletelySolved()) {
    puzzle.finish(SolveState::Solved, ActionType::PuzzleSolved, ActionReason::PuzzleSolved);
    return false;
  }

  const SolveParameters &params = puzzle.getSolveParameters();
  if (puzzle.getCheckCounter() >= params.maxChecks) {
    puzzle.finish(SolveState::StalledBudget,
                  ActionType::QuitMaxChecksExceeded,
                  ActionReason::MaxChecksExceeded);
    return false;
  }
  if (puzzle.getChecksWithoutAction() >= params.maxChecksWithoutAction) {
    puzzle.finish(SolveState::StalledStagnation,
                  ActionType::QuitMaxChecksWithoutActionExceeded,
                  ActionReason::MaxChecksWithoutActionExceeded);
    return false;
  }

  return true;
}

// =========================================================
// Rules
// =========================================================

void checkCellAgainstArea(SudokuPuzzle &puzzle, Index idx, Area area) {
  if (puzzle.isFilled(idx)) {
    // already filled in; skip it
    return;
  }

  const std::vector<Index> peers = puzzle.cellsInArea(area, areaOf(idx, area), CellFilter::FilledCells, idx);
  for (size_t k = 0; k < peers.size(); k++) {
    puzzle.countCheck();
    puzzle.applyRemoveCandidate(idx, puzzle.getValue(peers[k]), reasonForArea(area));

    // narrowed to one candidate: filled as OnlyCandidate, not by this area
    if (puzzle.isFilled(idx)) {
      return;
    }
    if (!okayToKeepTrying(puzzle)) {
      return;
    }
  }
}

void checkOnlyPossibilityInArea(SudokuPuzzle &puzzle, Index idx, Area area) {
  if (puzzle.isFilled(idx)) {
    // already filled in; skip it
    return;
  }

  const std::vector<Index> others = puzzle.cellsInArea(area, areaOf(idx, area), CellFilter::AllCells, idx);
  const Mask candidates = puzzle.cell(idx).getCandidateMask();

  for (Digit digit = 1; digit <= 9; digit++) {
    if ((candidates & digitToBit(digit)) == 0) {
      continue;
    }

    // filled cells report { value }, so a placed digit always counts as found
    bool possibilityFound = false;
    for (size_t k = 0; k < others.size(); k++) {
      puzzle.countCheck();
      if (puzzle.hasCandidate(others[k], digit)) {
        possibilityFound = true;
        break;
      }
      if (!okayToKeepTrying(puzzle)) {
        // an interrupted scan proves nothing
        return;
      }
    }

    if (!possibilityFound) {
      puzzle.applyFill(idx, digit, reasonForArea(area));
      return;
    }
    if (!okayToKeepTrying(puzzle)) {
      return;
    }
  }
}

typedef void (*RuleFn)(SudokuPuzzle &, Index, Area);

struct CellCheck {
  RuleFn rule;
  Area area;
};

// fixed order, reproduced exactly for deterministic logs and step counts
static const CellCheck CELL_CHECKS[] =
{
  { &checkOnlyPossibilityInArea, Area::Row },
  { &checkOnlyPossibilityInArea, Area::Column },
  { &checkOnlyPossibilityInArea, Area::Box },
  { &checkCellAgainstArea, Area::Row },
  { &checkCellAgainstArea, Area::Column },
  { &checkCellAgainstArea, Area::Box }
};

void checkCell(SudokuPuzzle &puzzle, Index idx) {
  for (size_t i = 0; i < (sizeof(CELL_CHECKS) / sizeof(CELL_CHECKS[0])); i++) {
    if (!okayToKeepTrying(puzzle) || puzzle.isFilled(idx)) {
      return;
    }
    CELL_CHECKS[i].rule(puzzle, idx, CELL_CHECKS[i].area);
  }
}

// =========================================================
// Control loop
// =========================================================

SolveState solve(SudokuPuzzle &puzzle, const SolveParameters &params) {
  if (puzzle.getState() != SolveState::Running) {
    return puzzle.getState();
  }

  SolveParameters effective = params;
  if (effective.maxChecks == 0) {
    effective.maxChecks = DEFAULT_MAX_CHECKS;
  }
  if (effective.maxChecksWithoutAction == 0) {
    effective.maxChecksWithoutAction = DEFAULT_MAX_CHECKS_WITHOUT_ACTION;
  }
  puzzle.setSolveParameters(effective);

  while (okayToKeepTrying(puzzle)) {
    // cells filled by a cascade earlier in this sweep are skipped by checkCell
    const std::vector<Index> unfilledCells = puzzle.unfilledCells();
    for (size_t k = 0; k < unfilledCells.size(); k++) {
      if (!okayToKeepTrying(puzzle)) {
        break;
      }
      checkCell(puzzle, unfilledCells[k]);
    }
  }

  if (puzzle.getState() == SolveState::Solved) {
    verifySolution(puzzle);
  }
  return puzzle.getState();
}

void verifySolution(const SudokuPuzzle &puzzle) {
  static const Area ORDER[3] = { Area::Box, Area::Column, Area::Row };

  for (Index idx = 0; idx < 81; idx++) {
    const Digit value = puzzle.getValue(idx);
    if (value == 0) {
      throw ConflictError(idx, 0, Area::Box, idx, 0);
    }
    for (int a = 0; a < 3; a++) {
      const Area area = ORDER[a];
      const std::vector<Index> peers = puzzle.cellsInArea(area, areaOf(idx, area), CellFilter::AllCells, idx);
      for (size_t k = 0; k < peers.size(); k++) {
        const Digit other = puzzle.getValue(peers[k]);
        if (other == 0 || other == value) {
          throw ConflictError(idx, value, area, peers[k], other);
        }
      }
    }
  }
}

// =========================================================
// Public API exported to C
// =========================================================

static void exportSolution(const SudokuPuzzle &puzzle, char *out81) {
  const std::string solution = puzzle.solutionString();
  std::memcpy(out81, solution.data(), 81);
  out81[81] = '\0';
}

static void clearStep(uint32_t *out) {
  for (int i = 0; i < 5; i++) {
    out[i] = 0;
  }
}

extern "C"
{
  // Solves an entire Sudoku given its initial representation in one shot.
  // out81 must hold 82 chars.
  int sudoprop_solver_full(const char *in81, char *out81, uint32_t maxChecks, uint32_t maxChecksWithoutAction) {
    if (in81 == nullptr || out81 == nullptr) {
      return 0;
    }

    std::unique_ptr<SudokuPuzzle> puzzle;
    try {
      puzzle.reset(new SudokuPuzzle(SudokuPuzzle::fromString(in81)));
    } catch (const ConstructionError &) {
      return 0;
    } catch (const std::exception &) {
      return -1;
    }

    int rc;
    try {
      rc = (int)solve(*puzzle, SolveParameters(maxChecks, maxChecksWithoutAction));
    } catch (const InternalConsistencyError &) {
      rc = -1;
    } catch (const std::exception &) {
      // nothing may unwind into a C caller
      rc = -1;
    }

    exportSolution(*puzzle, out81);
    return rc;
  }

  // Solves the board into module state so that its action log can be
  // replayed with sudoprop_solver_next_step.
  int sudoprop_solver_init_board(const char *in81, uint32_t maxChecks, uint32_t maxChecksWithoutAction) {
    g_puzzle.reset();
    g_replayCursor = 0;

    if (in81 == nullptr) {
      return 0;
    }

    try {
      g_puzzle.reset(new SudokuPuzzle(SudokuPuzzle::fromString(in81)));
    } catch (const ConstructionError &) {
      return 0;
    } catch (const std::exception &) {
      return -1;
    }

    try {
      return (int)solve(*g_puzzle, SolveParameters(maxChecks, maxChecksWithoutAction));
    } catch (const InternalConsistencyError &) {
      // the log up to the failure stays replayable
      return -1;
    } catch (const std::exception &) {
      return -1;
    }
  }

  // Returns the next logged action of the loaded board.
  // Returns 0 when the log is exhausted or the buffer is too small, else 1.
  int sudoprop_solver_next_step(uint32_t *out, uint32_t out_words) {
    if (out == nullptr || out_words < 5) {
      return 0;
    }

    if (!g_puzzle || g_replayCursor >= g_puzzle->getActions().size()) {
      // nothing left to replay
      clearStep(out);
      return 0;
    }

    // serialize action and send it back
    const SudokuAction &action = g_puzzle->getActions()[g_replayCursor++];
    out[0] = (uint32_t)action.getType();
    out[1] = action.getCells().empty() ? 0xFFu : (uint32_t)action.getCells()[0];
    out[2] = action.getCandidates().empty() ? 0u : (uint32_t)action.getCandidates()[0];
    out[3] = (uint32_t)action.getReason();
    out[4] = action.getStep();
    return 1;
  }

  // Checks spent by the last sudoprop_solver_init_board call.
  uint32_t sudoprop_solver_check_count(void) {
    return g_puzzle ? g_puzzle->getCheckCounter() : 0u;
  }
} // extern "C"
