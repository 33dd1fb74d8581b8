#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "PuzzlePrinter.hpp"
#include "SudokuErrors.hpp"
#include "solver.hpp"

#define SUDOPROP_LOG(...) fmt::print(stderr, __VA_ARGS__)

enum ExitCode {
  EXIT_ALL_SOLVED = 0,
  EXIT_STALLED = 1,
  EXIT_USAGE = 2,
  EXIT_INTERNAL_ERROR = 3
};

struct CliOptions {
  CliOptions() : trace(false), maxChecks(DEFAULT_MAX_CHECKS),
                 maxChecksWithoutAction(DEFAULT_MAX_CHECKS_WITHOUT_ACTION) { }

  PrintOptions print;
  bool trace;
  uint32_t maxChecks;
  uint32_t maxChecksWithoutAction;
  std::string puzzle;
  std::string file;
};

static const std::vector<std::vector<int>> CLASSIC_PUZZLE = {
  { 5, 3, 0, 0, 7, 0, 0, 0, 0 },
  { 6, 0, 0, 1, 9, 5, 0, 0, 0 },
  { 0, 9, 8, 0, 0, 0, 0, 6, 0 },
  { 8, 0, 0, 0, 6, 0, 0, 0, 3 },
  { 4, 0, 0, 8, 0, 3, 0, 0, 1 },
  { 7, 0, 0, 0, 2, 0, 0, 0, 6 },
  { 0, 6, 0, 0, 0, 0, 2, 8, 0 },
  { 0, 0, 0, 4, 1, 9, 0, 0, 5 },
  { 0, 0, 0, 0, 8, 0, 0, 7, 9 }
};

static void usage(const char *argv0) {
  SUDOPROP_LOG("Usage: {} [--color] [--trace] [--max-checks=N] [--max-idle-checks=N] [puzzle81 | --file=path]\n"
               "  puzzle81 holds 81 symbols: digits 1-9 for givens, 0 or '.' for empty cells.\n"
               "  --max-checks and --max-idle-checks take a positive count (defaults 10000 and 500).\n"
               "  --file solves the first 81-symbol token of every non-empty, non-comment line.\n"
               "  Without a puzzle the built-in example grid is solved.\n"
               "Exit codes: 0 all solved, 1 some puzzle stalled, 2 usage or input error, 3 internal error.\n", argv0);
}

static bool parseCount(const std::string &text, uint32_t *out) {
  if (text.empty() || text.size() > 9) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  *out = (uint32_t)std::strtoul(text.c_str(), nullptr, 10);
  return *out > 0;
}

static bool parseArgs(int argc, char **argv, CliOptions *opts) {
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--color") {
      opts->print.enableColor = true;
    } else if (a == "--trace") {
      opts->trace = true;
    } else if (a.rfind("--max-checks=", 0) == 0) {
      if (!parseCount(a.substr(std::strlen("--max-checks=")), &opts->maxChecks)) {
        SUDOPROP_LOG("Invalid value in {}\n", a);
        return false;
      }
    } else if (a.rfind("--max-idle-checks=", 0) == 0) {
      if (!parseCount(a.substr(std::strlen("--max-idle-checks=")), &opts->maxChecksWithoutAction)) {
        SUDOPROP_LOG("Invalid value in {}\n", a);
        return false;
      }
    } else if (a.rfind("--file=", 0) == 0) {
      opts->file = a.substr(std::strlen("--file="));
    } else if (a.rfind("--", 0) == 0) {
      SUDOPROP_LOG("Unknown option: {}\n", a);
      return false;
    } else if (opts->puzzle.empty()) {
      opts->puzzle = a;
    } else {
      SUDOPROP_LOG("Unexpected argument: {}\n", a);
      return false;
    }
  }
  if (!opts->file.empty() && !opts->puzzle.empty()) {
    SUDOPROP_LOG("Give either a puzzle or --file, not both\n");
    return false;
  }
  return true;
}

// solves one puzzle and prints the outcome; returns the puzzle's exit code
static int runOne(SudokuPuzzle &puzzle, const CliOptions &opts) {
  fmt::print("Starting solve...\n{}", renderGrid(puzzle, opts.print));

  try {
    solve(puzzle, SolveParameters(opts.maxChecks, opts.maxChecksWithoutAction));
  } catch (const InternalConsistencyError &e) {
    SUDOPROP_LOG("{}\n", e.what());
    fmt::print("{}", renderGrid(puzzle, opts.print));
    return EXIT_INTERNAL_ERROR;
  }

  if (opts.trace) {
    const std::vector<SudokuAction> &actions = puzzle.getActions();
    for (size_t i = 0; i < actions.size(); i++) {
      SUDOPROP_LOG("{}\n", describeAction(actions[i]));
    }
  }

  fmt::print("{}\n{}", describeOutcome(puzzle), renderGrid(puzzle, opts.print));
  fmt::print("{}\n", puzzle.solutionString());
  return puzzle.getState() == SolveState::Solved ? EXIT_ALL_SOLVED : EXIT_STALLED;
}

static int runFile(const CliOptions &opts) {
  std::ifstream fin(opts.file);
  if (!fin) {
    SUDOPROP_LOG("Failed to open file: {}\n", opts.file);
    return EXIT_USAGE;
  }

  int rc = EXIT_ALL_SOLVED;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(fin, line)) {
    lineNo++;
    const size_t first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || line[first] == '#') {
      continue;
    }

    // "<81 symbols> [expected outcome]": only the first token is the grid
    const size_t last = line.find_first_of(" \t\r\n", first);
    const std::string grid = line.substr(first, last == std::string::npos ? std::string::npos : last - first);

    fmt::print("[line {}]\n", lineNo);
    try {
      SudokuPuzzle puzzle = SudokuPuzzle::fromString(grid);
      const int one = runOne(puzzle, opts);
      if (one > rc) {
        rc = one;
      }
    } catch (const ConstructionError &e) {
      SUDOPROP_LOG("line {}: {}\n", lineNo, e.what());
      if (rc < EXIT_USAGE) {
        rc = EXIT_USAGE;
      }
    }
    fmt::print("\n");
  }
  return rc;
}

int main(int argc, char **argv) {
  CliOptions opts;
  if (!parseArgs(argc, argv, &opts)) {
    usage(argv[0]);
    return EXIT_USAGE;
  }

  if (!opts.file.empty()) {
    return runFile(opts);
  }

  try {
    SudokuPuzzle puzzle = opts.puzzle.empty()
        ? SudokuPuzzle::fromGrid(CLASSIC_PUZZLE)
        : SudokuPuzzle::fromString(opts.puzzle);
    return runOne(puzzle, opts);
  } catch (const ConstructionError &e) {
    SUDOPROP_LOG("{}\n", e.what());
    usage(argv[0]);
    return EXIT_USAGE;
  }
}
