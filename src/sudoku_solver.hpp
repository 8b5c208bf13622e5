#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <vector>

#include "sudoku_board.hpp"

// One step of a traced search: the board right after a digit was placed or removed
struct Placement {
    SudokuBoard board;
    int row;
    int col;
    int digit;
    bool placed; // false for a backtrack removal
};

using SolveTrace = std::vector<Placement>;

/**
 * Depth-first backtracking solver.
 * Empty cells are visited in row-major order and digits are tried 1..9 in
 * ascending order, so the solution found and the shape of the trace are fixed
 * for a given board. The board is borrowed for the duration of a call and
 * every tentative write is undone on backtrack.
 *
 * A board whose clues already break a row, column or box rule is reported as
 * unsolvable without searching.
 */
class SudokuSolver {
public:
    static constexpr int N = SudokuBoard::N;
    static constexpr int CELL_COUNT = SudokuBoard::CELL_COUNT;

    SudokuSolver();

    // Leaves board solved and returns true, or returns false with board unchanged
    bool solve(SudokuBoard& board);

    // Same search on a copy. An empty result means no solution, unless the
    // board was already complete (nothing to place); check isComplete() first.
    SolveTrace solveTraced(const SudokuBoard& board);

    // Number of completions, stopping as soon as limit is reached. board is restored.
    int countSolutions(SudokuBoard& board, int limit = 2);

    // Like solve(), but each cell tries a fresh random permutation of 1..9
    bool solveRandomized(SudokuBoard& board, std::mt19937& rng);

private:
    SudokuBoard* board = nullptr;
    SolveTrace* trace = nullptr;
    std::mt19937* rng = nullptr;

    std::array<uint16_t, N> row_mask;
    std::array<uint16_t, N> col_mask;
    std::array<uint16_t, N> box_mask;
    std::array<int, CELL_COUNT> box_indices;
    std::vector<int> empty_cells;

    bool load(SudokuBoard& target);
    void place(int idx, int val);
    void remove(int idx, int val);
    uint16_t get_candidates(int idx) const;
    bool solve_recursive(size_t k);
    int count_recursive(size_t k, int limit);
};

bool solveInstant(SudokuBoard& board);
// Empty for an unsolvable board and for one that is already complete
SolveTrace solveTraced(const SudokuBoard& board);
int countSolutions(SudokuBoard& board, int limit = 2);

// Final board of a trace replayed over original (original itself for an empty trace)
SudokuBoard replayTrace(const SudokuBoard& original, const SolveTrace& trace);
