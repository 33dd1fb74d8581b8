#include "SudokuPuzzle.hpp"
#include "SudokuErrors.hpp"
#include <sstream>
#include <stdexcept>

// =========================================================
// SudokuPuzzle
// =========================================================

// empty puzzle, every cell unfilled with no candidates
SudokuPuzzle::SudokuPuzzle()
  : checkCounter(0),
    checkWithAction(false),
    lastCheckWithAction(0),
    state(SolveState::Running),
    unfilled(81) {
  for (Index idx = 0; idx < 81; idx++) {
    cells[idx].place(idx);
  }
  int fill[9] = {0};
  for (Index idx = 0; idx < 81; idx++) {
    const int b = idxBox(idx);
    boxes[b][fill[b]++] = idx;
  }
}

SudokuPuzzle SudokuPuzzle::fromGrid(const std::vector<std::vector<int>> &grid) {
  if (grid.size() != 9) {
    std::ostringstream oss;
    oss << "Expected 9 rows, got " << grid.size();
    throw ConstructionError(oss.str());
  }
  for (size_t r = 0; r < grid.size(); r++) {
    if (grid[r].size() != 9) {
      std::ostringstream oss;
      oss << "Expected 9 columns in row " << (r + 1) << ", got " << grid[r].size();
      throw ConstructionError(oss.str());
    }
  }

  SudokuPuzzle puzzle;
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      const int v = grid[(size_t)r][(size_t)c];
      if (v < 0 || v > 9) {
        std::ostringstream oss;
        oss << "Invalid value " << v << " at row " << (r + 1) << ", column " << (c + 1)
            << " (allowed: 0 for empty, 1-9)";
        throw ConstructionError(oss.str());
      }
      if (v != 0) {
        puzzle.cells[r * 9 + c].makeGiven((Digit)v);
        puzzle.unfilled--;
      }
    }
  }

  puzzle.initializeCandidates();
  return puzzle;
}

SudokuPuzzle SudokuPuzzle::fromString(const std::string &values) {
  // parse: digits 1..9 are values; 0 or '.' are empty; whitespace is skipped
  std::vector<std::vector<int>> grid(9, std::vector<int>(9, 0));
  int tokens = 0;
  for (size_t i = 0; i < values.size(); i++) {
    const char ch = values[i];
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      continue;
    }
    if (!((ch >= '0' && ch <= '9') || ch == '.')) {
      std::ostringstream oss;
      oss << "Invalid character '" << ch << "' at position " << i << " (allowed: 0-9 or .)";
      throw ConstructionError(oss.str());
    }
    if (tokens == 81) {
      throw ConstructionError("Expected 81 cells, got more");
    }
    grid[(size_t)(tokens / 9)][(size_t)(tokens % 9)] = (ch == '.') ? 0 : ch - '0';
    ++tokens;
  }

  if (tokens < 81) {
    std::ostringstream oss;
    oss << "Expected 81 cells, got " << tokens;
    throw ConstructionError(oss.str());
  }

  return fromGrid(grid);
}

// --- cells API ---
const SudokuCell &SudokuPuzzle::cell(Index idx) const {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("SudokuPuzzle::cell() index out of range");
  }
  return cells[idx];
}

Digit SudokuPuzzle::getValue(Index idx) const {
  return cell(idx).getValue();
}

bool SudokuPuzzle::isFilled(Index idx) const {
  return cell(idx).isFilled();
}

bool SudokuPuzzle::hasCandidate(Index idx, Digit digit) const {
  return cell(idx).hasCandidate(digit);
}

size_t SudokuPuzzle::countUnfilled() const {
  return unfilled;
}

bool SudokuPuzzle::isCompletelySolved() const {
  return unfilled == 0;
}

const Index *SudokuPuzzle::boxCells(int box) const {
  if (box < 0 || box > 8) {
    throw std::out_of_range("SudokuPuzzle::boxCells() box out of range");
  }
  return boxes[box];
}

// --- peer queries ---
std::vector<Index> SudokuPuzzle::cellsInArea(Area area, int areaIndex, CellFilter filter,
                                             Index excludeIdx) const {
  if (areaIndex < 0 || areaIndex > 8) {
    throw std::out_of_range("SudokuPuzzle::cellsInArea() area index out of range");
  }

  const Index *unit = (area == Area::Box) ? boxes[areaIndex] : areaCells(area, areaIndex);
  std::vector<Index> out;
  out.reserve(9);
  for (int k = 0; k < 9; k++) {
    const Index idx = unit[k];
    if (idx == excludeIdx) {
      continue;
    }
    if (filter == CellFilter::FilledCells && !cells[idx].isFilled()) {
      continue;
    }
    if (filter == CellFilter::UnfilledCells && cells[idx].isFilled()) {
      continue;
    }
    out.push_back(idx);
  }
  return out;
}

std::vector<Index> SudokuPuzzle::cellsInRow(int row, CellFilter filter, Index excludeIdx) const {
  return cellsInArea(Area::Row, row, filter, excludeIdx);
}

std::vector<Index> SudokuPuzzle::cellsInColumn(int column, CellFilter filter, Index excludeIdx) const {
  return cellsInArea(Area::Column, column, filter, excludeIdx);
}

std::vector<Index> SudokuPuzzle::cellsInBox(int box, CellFilter filter, Index excludeIdx) const {
  return cellsInArea(Area::Box, box, filter, excludeIdx);
}

std::vector<Index> SudokuPuzzle::unfilledCells() const {
  std::vector<Index> out;
  out.reserve(unfilled);
  for (Index idx = 0; idx < 81; idx++) {
    if (!cells[idx].isFilled()) {
      out.push_back(idx);
    }
  }
  return out;
}

// --- solve bookkeeping ---
const std::vector<SudokuAction> &SudokuPuzzle::getActions() const {
  return actions;
}

uint32_t SudokuPuzzle::getCheckCounter() const {
  return checkCounter;
}

bool SudokuPuzzle::hasCheckWithAction() const {
  return checkWithAction;
}

uint32_t SudokuPuzzle::getLastCheckWithAction() const {
  return lastCheckWithAction;
}

uint32_t SudokuPuzzle::getChecksWithoutAction() const {
  return checkWithAction ? checkCounter - lastCheckWithAction : checkCounter;
}

const SolveParameters &SudokuPuzzle::getSolveParameters() const {
  return solveParameters;
}

void SudokuPuzzle::setSolveParameters(const SolveParameters &params) {
  solveParameters = params;
}

SolveState SudokuPuzzle::getState() const {
  return state;
}

std::string SudokuPuzzle::solutionString() const {
  std::string out(81, '0');
  for (Index idx = 0; idx < 81; idx++) {
    out[(size_t)idx] = (char)('0' + cells[idx].getValue());
  }
  return out;
}

// --- events API ---
void SudokuPuzzle::countCheck() {
  checkCounter++;
}

bool SudokuPuzzle::applyRemoveCandidate(Index idx, Digit digit, ActionReason reason) {
  if (!cells[idx].disableCandidate(digit)) {
    return false;
  }
  logAction(SudokuAction(ActionType::RemoveCandidates, reason, checkCounter, idx, digit));

  // a cell narrowed to one candidate is filled on the spot, cascading
  const Digit only = cells[idx].getSingleCandidate();
  if (only != 0) {
    applyFill(idx, only, ActionReason::OnlyCandidate);
  }
  return true;
}

void SudokuPuzzle::applyFill(Index idx, Digit digit, ActionReason reason) {
  // Set + Auto clear
  if (cells[idx].isFilled()) {
    std::ostringstream oss;
    oss << "ERROR at step " << checkCounter << ": Asked to fill in cell " << idx
        << " (row " << (idxRow(idx) + 1) << ", column " << (idxCol(idx) + 1) << ") with value "
        << (int)digit << ", but it already has a value (" << (int)cells[idx].getValue() << ")";
    throw InternalConsistencyError(oss.str());
  }
  cells[idx].fill(digit);
  unfilled--;
  logAction(SudokuAction(ActionType::FillCell, reason, checkCounter, idx, digit));
  autoClearPeersAfterPlacement(idx, digit);
}

void SudokuPuzzle::autoClearPeersAfterPlacement(Index idx, Digit digit) {
  // one pass in index order; a neighbour sharing several areas is
  // reported under box first, then column, then row
  for (Index peer = 0; peer < 81; peer++) {
    if (peer == idx || cells[peer].isFilled()) {
      continue;
    }
    if (sharesArea(peer, idx, Area::Box)) {
      applyRemoveCandidate(peer, digit, ActionReason::BoxCheck);
    } else if (sharesArea(peer, idx, Area::Column)) {
      applyRemoveCandidate(peer, digit, ActionReason::ColumnCheck);
    } else if (sharesArea(peer, idx, Area::Row)) {
      applyRemoveCandidate(peer, digit, ActionReason::RowCheck);
    }
  }
}

void SudokuPuzzle::finish(SolveState terminal, ActionType type, ActionReason reason) {
  if (state != SolveState::Running) {
    throw std::logic_error("SudokuPuzzle::finish() on a finished puzzle");
  }
  if (terminal == SolveState::Running) {
    throw std::logic_error("SudokuPuzzle::finish() needs a terminal state");
  }
  state = terminal;
  logAction(SudokuAction(type, reason, checkCounter));
}

void SudokuPuzzle::logAction(const SudokuAction &action) {
  actions.push_back(action);
  // terminal entries close the log but are not progress
  if (action.isInference()) {
    checkWithAction = true;
    lastCheckWithAction = checkCounter;
  }
}

void SudokuPuzzle::initializeCandidates() {
  // every unfilled cell starts from 1..9, narrowed by its filled peers:
  // row first, then column, then box. Cells not seeded yet hold no
  // candidates, so a fill cascading from an earlier cell leaves them
  // alone and they see it as a filled peer instead.
  static const Area ORDER[3] = { Area::Row, Area::Column, Area::Box };

  for (Index idx = 0; idx < 81; idx++) {
    if (cells[idx].isFilled()) {
      continue;
    }
    cells[idx].seedCandidates(ALL_DIGITS);
    for (int a = 0; a < 3 && !cells[idx].isFilled(); a++) {
      const Area area = ORDER[a];
      const std::vector<Index> peers = cellsInArea(area, areaOf(idx, area), CellFilter::FilledCells, idx);
      for (size_t k = 0; k < peers.size(); k++) {
        applyRemoveCandidate(idx, cells[peers[k]].getValue(), reasonForArea(area));
      }
    }
  }
}
