#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

/**
 * 9x9 Sudoku grid with value semantics.
 * Cells hold 0 (empty) or a digit 1..9. Every mutator checks its arguments,
 * so a SudokuBoard can never hold a malformed grid.
 */
class SudokuBoard {
public:
    static constexpr int N = 9;
    static constexpr int BOX = 3;
    static constexpr int CELL_COUNT = 81;
    static constexpr int EMPTY = 0;
    using Cells = std::array<uint8_t, CELL_COUNT>;

    SudokuBoard();

    // Throws cv::Exception on wrong dimensions or values outside 0..9
    static SudokuBoard fromRows(const std::vector<std::vector<int>>& rows);
    // '1'-'9' are digits, '0' and '.' are empty; whitespace and | - + are skipped
    static SudokuBoard fromString(std::string_view text);

    int at(int row, int col) const;
    void set(int row, int col, int value);
    void clear(int row, int col) { set(row, col, EMPTY); }
    bool isEmpty(int row, int col) const { return at(row, col) == EMPTY; }

    int clueCount() const;
    int emptyCount() const { return CELL_COUNT - clueCount(); }
    bool isComplete() const { return clueCount() == CELL_COUNT; }

    std::vector<std::vector<int>> toRows() const;
    std::string toString() const;
    void print(std::ostream& out) const;

    const Cells& cells() const { return grid; }

    bool operator==(const SudokuBoard& other) const { return grid == other.grid; }
    bool operator!=(const SudokuBoard& other) const { return grid != other.grid; }

private:
    Cells grid;
};

std::ostream& operator<<(std::ostream& out, const SudokuBoard& board);

// The puzzle bundled with the tool (first row: 5 3 . . 7 . . . .)
SudokuBoard examplePuzzle();

struct CellPos {
    int row;
    int col;

    bool operator==(const CellPos& other) const { return row == other.row && col == other.col; }
    bool operator!=(const CellPos& other) const { return !(*this == other); }
};

/**
 * Cells that were clues when the puzzle was loaded.
 * Built once per puzzle and never changed while solving or editing.
 */
class FixedSet {
public:
    FixedSet();

    bool isFixed(int row, int col) const;
    int size() const;
    std::vector<CellPos> cells() const;

private:
    friend FixedSet fixedCells(const SudokuBoard& board);

    std::array<bool, SudokuBoard::CELL_COUNT> fixed;
};

FixedSet fixedCells(const SudokuBoard& board);

// Writes value (0 clears) unless (row, col) is a clue; returns false and leaves the board untouched for clues.
bool applyEdit(SudokuBoard& board, const FixedSet& fixed, int row, int col, int value);
