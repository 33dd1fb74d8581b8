#ifndef SUDOKU_ERRORS_H
#define SUDOKU_ERRORS_H

#include <stdexcept>
#include <string>
#include "utils.hpp"

class SudokuError : public std::runtime_error
{
public:
  explicit SudokuError(const std::string &what) : std::runtime_error(what) { }
};

// malformed input grid; solve is never attempted
class ConstructionError : public SudokuError
{
public:
  explicit ConstructionError(const std::string &what) : SudokuError(what) { }
};

// the engine produced a state it must never produce (fill on a filled
// cell, inconsistent solved grid); the solve result cannot be trusted
class InternalConsistencyError : public SudokuError
{
public:
  explicit InternalConsistencyError(const std::string &what) : SudokuError(what) { }
};

class ConflictError : public InternalConsistencyError
{
public:
  ConflictError(Index idx, Digit value, Area area, Index peer, Digit peerValue);

  Index index() const { return idx; }
  uint8_t row() const { return idxRow(idx); }
  uint8_t column() const { return idxCol(idx); }
  Digit value() const { return digit; }
  Area area() const { return where; }
  Index peer() const { return other; }

private:
  Index idx;
  Digit digit;
  Area where;
  Index other;
};

const char *areaName(Area area);

#endif // SUDOKU_ERRORS_H
