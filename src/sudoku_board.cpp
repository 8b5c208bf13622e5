#include "sudoku_board.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/core.hpp>

namespace {

void checkCoordinates(int row, int col) {
    if (row < 0 || row >= SudokuBoard::N || col < 0 || col >= SudokuBoard::N)
        CV_Error(cv::Error::StsOutOfRange, cv::format("cell (%d, %d) is outside the 9x9 grid", row, col));
}

} // namespace

SudokuBoard::SudokuBoard() {
    grid.fill(EMPTY);
}

SudokuBoard SudokuBoard::fromRows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != N)
        CV_Error(cv::Error::StsBadArg, cv::format("expected 9 rows, got %d", (int)rows.size()));

    SudokuBoard board;
    for (int r = 0; r < N; ++r) {
        if (rows[r].size() != N)
            CV_Error(cv::Error::StsBadArg, cv::format("row %d has %d cells, expected 9", r, (int)rows[r].size()));
        for (int c = 0; c < N; ++c) {
            int v = rows[r][c];
            if (v < 0 || v > 9)
                CV_Error(cv::Error::StsBadArg, cv::format("invalid value %d at (%d, %d)", v, r, c));
            board.grid[r * N + c] = static_cast<uint8_t>(v);
        }
    }
    return board;
}

SudokuBoard SudokuBoard::fromString(std::string_view text) {
    SudokuBoard board;
    int idx = 0;

    for (char ch : text) {
        // Layout characters, as produced by print()
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '|' || ch == '-' || ch == '+')
            continue;

        int v = EMPTY;
        if (ch >= '1' && ch <= '9') v = ch - '0';
        else if (ch != '.' && ch != '0')
            CV_Error(cv::Error::StsBadArg, cv::format("unexpected character '%c' in board text", ch));

        if (idx == CELL_COUNT)
            CV_Error(cv::Error::StsBadArg, "board text has more than 81 cells");
        board.grid[idx++] = static_cast<uint8_t>(v);
    }

    if (idx != CELL_COUNT)
        CV_Error(cv::Error::StsBadArg, cv::format("board text has %d cells, expected 81", idx));
    return board;
}

int SudokuBoard::at(int row, int col) const {
    checkCoordinates(row, col);
    return grid[row * N + col];
}

void SudokuBoard::set(int row, int col, int value) {
    checkCoordinates(row, col);
    if (value < EMPTY || value > 9)
        CV_Error(cv::Error::StsOutOfRange, cv::format("value %d is not empty or a digit 1-9", value));
    grid[row * N + col] = static_cast<uint8_t>(value);
}

int SudokuBoard::clueCount() const {
    return static_cast<int>(std::count_if(grid.begin(), grid.end(), [](uint8_t v) { return v != EMPTY; }));
}

std::vector<std::vector<int>> SudokuBoard::toRows() const {
    std::vector<std::vector<int>> rows(N, std::vector<int>(N));
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            rows[r][c] = grid[r * N + c];
    return rows;
}

std::string SudokuBoard::toString() const {
    std::string s(CELL_COUNT, '.');
    for (int i = 0; i < CELL_COUNT; ++i)
        if (grid[i] != EMPTY) s[i] = static_cast<char>('0' + grid[i]);
    return s;
}

void SudokuBoard::print(std::ostream& out) const {
    for (int r = 0; r < N; ++r) {
        if (r > 0 && r % BOX == 0) out << "------+-------+------\n";
        for (int c = 0; c < N; ++c) {
            if (c > 0 && c % BOX == 0) out << "| ";
            out << (grid[r * N + c] == EMPTY ? '.' : (char)('0' + grid[r * N + c])) << " ";
        }
        out << "\n";
    }
}

std::ostream& operator<<(std::ostream& out, const SudokuBoard& board) {
    board.print(out);
    return out;
}

SudokuBoard examplePuzzle() {
    return SudokuBoard::fromRows({
        {5,3,0,0,7,0,0,0,0},
        {6,0,0,1,9,5,0,0,0},
        {0,9,8,0,0,0,0,6,0},
        {8,0,0,0,6,0,0,0,3},
        {4,0,0,8,0,3,0,0,1},
        {7,0,0,0,2,0,0,0,6},
        {0,6,0,0,0,0,2,8,0},
        {0,0,0,4,1,9,0,0,5},
        {0,0,0,0,8,0,0,7,9},
    });
}

FixedSet::FixedSet() {
    fixed.fill(false);
}

bool FixedSet::isFixed(int row, int col) const {
    checkCoordinates(row, col);
    return fixed[row * SudokuBoard::N + col];
}

int FixedSet::size() const {
    return static_cast<int>(std::count(fixed.begin(), fixed.end(), true));
}

std::vector<CellPos> FixedSet::cells() const {
    std::vector<CellPos> out;
    for (int i = 0; i < SudokuBoard::CELL_COUNT; ++i)
        if (fixed[i]) out.push_back({i / SudokuBoard::N, i % SudokuBoard::N});
    return out;
}

FixedSet fixedCells(const SudokuBoard& board) {
    FixedSet set;
    const auto& cells = board.cells();
    for (int i = 0; i < SudokuBoard::CELL_COUNT; ++i)
        set.fixed[i] = cells[i] != SudokuBoard::EMPTY;
    return set;
}

bool applyEdit(SudokuBoard& board, const FixedSet& fixed, int row, int col, int value) {
    if (fixed.isFixed(row, col)) return false;
    board.set(row, col, value);
    return true;
}
