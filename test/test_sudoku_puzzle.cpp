#include <catch2/catch.hpp>
#include <stdexcept>
#include "SudokuErrors.hpp"
#include "SudokuPuzzle.hpp"
#include "test_puzzles.hpp"

TEST_CASE("fromGrid assigns geometry and givens", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromGrid(CLASSIC_GRID);

  const SudokuCell &center = puzzle.cell(40);
  REQUIRE(center.getIndex() == 40);
  REQUIRE(center.getRow() == 4);
  REQUIRE(center.getColumn() == 4);
  REQUIRE(center.getBox() == 4);
  REQUIRE_FALSE(center.isGiven());

  REQUIRE(puzzle.cell(30).getBox() == 4);
  REQUIRE(puzzle.cell(80).getBox() == 8);
  REQUIRE(puzzle.cell(26).getBox() == 2);

  REQUIRE(puzzle.cell(0).isGiven());
  REQUIRE(puzzle.getValue(0) == 5);
  REQUIRE(puzzle.getValue(80) == 9);
  // every empty cell of this grid falls to a chain of single candidates
  REQUIRE(puzzle.countUnfilled() == 0);
  REQUIRE(puzzle.getState() == SolveState::Running);
  REQUIRE(puzzle.getCheckCounter() == 0);
}

TEST_CASE("boxes group cell indices ascending", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromGrid(CLASSIC_GRID);
  const Index expected[9] = { 30, 31, 32, 39, 40, 41, 48, 49, 50 };
  const Index *box = puzzle.boxCells(4);
  for (int k = 0; k < 9; k++) {
    REQUIRE(box[k] == expected[k]);
  }
  REQUIRE_THROWS_AS(puzzle.boxCells(9), std::out_of_range);
}

TEST_CASE("fromGrid rejects malformed grids", "[puzzle][errors]") {
  SECTION("too few rows") {
    std::vector<std::vector<int>> grid(CLASSIC_GRID.begin(), CLASSIC_GRID.end() - 1);
    REQUIRE_THROWS_AS(SudokuPuzzle::fromGrid(grid), ConstructionError);
  }

  SECTION("a row that is too long") {
    std::vector<std::vector<int>> grid = CLASSIC_GRID;
    grid[3].push_back(0);
    REQUIRE_THROWS_AS(SudokuPuzzle::fromGrid(grid), ConstructionError);
  }

  SECTION("digits outside 0..9 are not clamped") {
    std::vector<std::vector<int>> grid = CLASSIC_GRID;
    grid[2][7] = 10;
    REQUIRE_THROWS_WITH(SudokuPuzzle::fromGrid(grid), Catch::Contains("row 3, column 8"));
    grid[2][7] = -1;
    REQUIRE_THROWS_AS(SudokuPuzzle::fromGrid(grid), ConstructionError);
  }
}

TEST_CASE("fromString reads the 81 symbol format", "[puzzle]") {
  SECTION("dots and whitespace") {
    std::string text = CLASSIC_STRING;
    for (size_t i = 0; i < text.size(); i++) {
      if (text[i] == '0') {
        text[i] = '.';
      }
    }
    text.insert(27, "\n  ");
    const SudokuPuzzle puzzle = SudokuPuzzle::fromString(text);
    REQUIRE(puzzle.solutionString() == CLASSIC_SOLUTION);
    REQUIRE(puzzle.cell(0).isGiven());
    REQUIRE_FALSE(puzzle.cell(2).isGiven());
  }

  SECTION("bad symbols and lengths") {
    REQUIRE_THROWS_AS(SudokuPuzzle::fromString(CLASSIC_STRING.substr(0, 80)), ConstructionError);
    REQUIRE_THROWS_AS(SudokuPuzzle::fromString(CLASSIC_STRING + "1"), ConstructionError);
    std::string text = CLASSIC_STRING;
    text[10] = 'x';
    REQUIRE_THROWS_AS(SudokuPuzzle::fromString(text), ConstructionError);
  }
}

TEST_CASE("duplicate givens are accepted at construction", "[puzzle]") {
  std::string text = CLASSIC_STRING;
  text[2] = '5';
  REQUIRE_NOTHROW(SudokuPuzzle::fromString(text));
}

TEST_CASE("candidate initialization narrows by row, column, then box", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);

  // row 0 holds 5 3 4 9, column 3 holds 7 2, box 1 adds nothing new
  REQUIRE(puzzle.cell(3).getCandidateMask() == (digitToBit(1) | digitToBit(6) | digitToBit(8)));

  const std::vector<SudokuAction> &actions = puzzle.getActions();
  REQUIRE(actions.size() == 324);
  REQUIRE(actions[0].getCells()[0] == 3);
  REQUIRE(actions[0].getCandidates()[0] == 5);
  REQUIRE(actions[0].getReason() == ActionReason::RowCheck);
  REQUIRE(actions[3].getCandidates()[0] == 9);
  REQUIRE(actions[4].getCandidates()[0] == 7);
  REQUIRE(actions[4].getReason() == ActionReason::ColumnCheck);

  size_t fills = 0;
  for (size_t i = 0; i < actions.size(); i++) {
    REQUIRE(actions[i].getStep() == 0);
    if (actions[i].getType() == ActionType::FillCell) {
      REQUIRE(actions[i].getReason() == ActionReason::OnlyCandidate);
      fills++;
    } else {
      REQUIRE(actions[i].getType() == ActionType::RemoveCandidates);
    }
  }
  REQUIRE(fills == 7);
  REQUIRE(puzzle.countUnfilled() == 44);
  REQUIRE(puzzle.getCheckCounter() == 0);
  REQUIRE(puzzle.hasCheckWithAction());
  REQUIRE(puzzle.getLastCheckWithAction() == 0);
}

TEST_CASE("seeding fills a cell the moment one candidate is left", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);
  const std::vector<SudokuAction> &actions = puzzle.getActions();

  // the box removal of 5 leaves cell 42 with 7 only
  REQUIRE(actions[155].getType() == ActionType::RemoveCandidates);
  REQUIRE(actions[155].getCells()[0] == 42);
  REQUIRE(actions[155].getCandidates()[0] == 5);
  REQUIRE(actions[155].getReason() == ActionReason::BoxCheck);

  REQUIRE(actions[156].getType() == ActionType::FillCell);
  REQUIRE(actions[156].getCells()[0] == 42);
  REQUIRE(actions[156].getCandidates()[0] == 7);
  REQUIRE(actions[156].getReason() == ActionReason::OnlyCandidate);

  // and the fill clears 7 from the cells already seeded
  REQUIRE(actions[157].getType() == ActionType::RemoveCandidates);
  REQUIRE(actions[157].getCells()[0] == 15);
  REQUIRE(actions[157].getCandidates()[0] == 7);
  REQUIRE(actions[157].getReason() == ActionReason::ColumnCheck);

  REQUIRE(puzzle.getValue(42) == 7);
  REQUIRE_FALSE(puzzle.cell(42).isGiven());
}

TEST_CASE("the classic grid is completed while seeding", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromGrid(CLASSIC_GRID);
  const std::vector<SudokuAction> &actions = puzzle.getActions();

  REQUIRE(puzzle.isCompletelySolved());
  REQUIRE(puzzle.solutionString() == CLASSIC_SOLUTION);
  REQUIRE(puzzle.getState() == SolveState::Running);
  REQUIRE(actions.size() == 459);

  REQUIRE(actions[153].getType() == ActionType::FillCell);
  REQUIRE(actions[153].getCells()[0] == 40);
  REQUIRE(actions[153].getCandidates()[0] == 5);
  REQUIRE(actions.back().getType() == ActionType::FillCell);
  REQUIRE(actions.back().getCells()[0] == 78);
}

TEST_CASE("peer queries return ascending indices", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);

  REQUIRE(puzzle.cellsInRow(0, CellFilter::FilledCells) == std::vector<Index>({ 0, 1, 2, 6 }));
  REQUIRE(puzzle.cellsInRow(0, CellFilter::UnfilledCells, 3) == std::vector<Index>({ 4, 5, 7, 8 }));
  REQUIRE(puzzle.cellsInColumn(0, CellFilter::AllCells, 0) ==
          std::vector<Index>({ 9, 18, 27, 36, 45, 54, 63, 72 }));
  REQUIRE(puzzle.cellsInBox(0, CellFilter::FilledCells) == std::vector<Index>({ 0, 1, 2, 18, 19 }));
  REQUIRE(puzzle.cellsInArea(Area::Box, 8, CellFilter::AllCells).size() == 9);
  REQUIRE(puzzle.unfilledCells().size() == 44);
  REQUIRE(puzzle.unfilledCells().front() == 3);

  REQUIRE_THROWS_AS(puzzle.cellsInRow(9, CellFilter::AllCells), std::out_of_range);
  REQUIRE_THROWS_AS(puzzle.cell(81), std::out_of_range);
}

TEST_CASE("solution string renders unfilled cells as zero", "[puzzle]") {
  const SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);
  const std::string text = puzzle.solutionString();
  REQUIRE(text.size() == 81);
  REQUIRE(text == "534000900000090048190000000009701400000003700010004850060030284080410635345200179");
}

TEST_CASE("filling propagates to unfilled neighbours", "[puzzle]") {
  SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);
  const size_t before = puzzle.getActions().size();

  // cell 3 keeps { 1, 6, 8 }; no neighbour is left with a single candidate
  puzzle.applyFill(3, 1, ActionReason::RowCheck);

  const std::vector<SudokuAction> &actions = puzzle.getActions();
  REQUIRE(actions.size() == before + 4);
  REQUIRE(actions[before].getType() == ActionType::FillCell);
  REQUIRE(actions[before].getCells()[0] == 3);
  REQUIRE(puzzle.getValue(3) == 1);
  REQUIRE(puzzle.countUnfilled() == 43);

  for (size_t i = before + 1; i < actions.size(); i++) {
    const SudokuAction &action = actions[i];
    const Index peer = action.getCells()[0];
    REQUIRE(action.getType() == ActionType::RemoveCandidates);
    REQUIRE(action.getCandidates()[0] == 1);
    REQUIRE_FALSE(puzzle.hasCandidate(peer, 1));
    if (sharesArea(peer, 3, Area::Box)) {
      REQUIRE(action.getReason() == ActionReason::BoxCheck);
    } else if (sharesArea(peer, 3, Area::Column)) {
      REQUIRE(action.getReason() == ActionReason::ColumnCheck);
    } else {
      REQUIRE(action.getReason() == ActionReason::RowCheck);
    }
    if (i > before + 1) {
      REQUIRE(peer > actions[i - 1].getCells()[0]);
    }
  }

  REQUIRE_THROWS_AS(puzzle.applyFill(3, 6, ActionReason::OnlyCandidate), InternalConsistencyError);
  REQUIRE_THROWS_AS(puzzle.applyFill(0, 5, ActionReason::OnlyCandidate), InternalConsistencyError);
}

TEST_CASE("a neighbour left with one candidate is filled in the same cascade", "[puzzle]") {
  SudokuPuzzle puzzle = SudokuPuzzle::fromString(SCANNING_STRING);
  const size_t before = puzzle.getActions().size();

  puzzle.applyFill(3, 6, ActionReason::RowCheck);

  // cell 48 loses 6 and is filled before the sweep over cell 3's peers goes on
  const std::vector<SudokuAction> &actions = puzzle.getActions();
  REQUIRE(actions.size() == before + 36);
  REQUIRE(actions[before + 11].getType() == ActionType::RemoveCandidates);
  REQUIRE(actions[before + 11].getCells()[0] == 48);
  REQUIRE(actions[before + 12].getType() == ActionType::FillCell);
  REQUIRE(actions[before + 12].getCells()[0] == 48);
  REQUIRE(actions[before + 12].getCandidates()[0] == 9);
  REQUIRE(actions[before + 12].getReason() == ActionReason::OnlyCandidate);

  const Index cascaded[7] = { 48, 57, 39, 21, 12, 24, 15 };
  for (int k = 0; k < 7; k++) {
    REQUIRE(puzzle.isFilled(cascaded[k]));
    REQUIRE(puzzle.getValue(cascaded[k]) == CLASSIC_SOLUTION[(size_t)cascaded[k]] - '0');
  }
  REQUIRE(puzzle.countUnfilled() == 36);

  for (Index idx = 0; idx < 81; idx++) {
    if (!puzzle.isFilled(idx)) {
      REQUIRE(puzzle.cell(idx).countCandidates() > 1);
    }
  }
}
