#include "sudoku_solver.hpp"

#include <algorithm>
#include <bit>
#include <numeric>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

/**
 * Backtracking Sudoku solver
 * * 1. Bitmasks: rows, cols and boxes use 16-bit integers to track used digits.
 * 2. Lookup table: box index of every cell is precomputed.
 * 3. Scan order: empty cells are collected row-major once per call, so position
 *    k of empty_cells is always the first empty cell of the board.
 */

SudokuSolver::SudokuSolver() {
    for (int i = 0; i < CELL_COUNT; ++i) {
        int r = i / N;
        int c = i % N;
        box_indices[i] = (r / 3) * 3 + (c / 3);
    }
}

// Reset masks from target's clues. False when two clues share a row, column or box.
bool SudokuSolver::load(SudokuBoard& target) {
    board = &target;
    row_mask.fill(0);
    col_mask.fill(0);
    box_mask.fill(0);
    empty_cells.clear();
    empty_cells.reserve(CELL_COUNT);

    const auto& g = target.cells();
    for (int i = 0; i < CELL_COUNT; ++i) {
        int v = g[i];
        if (v == SudokuBoard::EMPTY) {
            empty_cells.push_back(i);
            continue;
        }
        uint16_t bit = 1 << (v - 1);
        int r = i / N;
        int c = i % N;
        if ((row_mask[r] | col_mask[c] | box_mask[box_indices[i]]) & bit) {
            CV_LOG_DEBUG(NULL, "clue " << v << " at (" << r << ", " << c << ") conflicts with another clue");
            return false;
        }
        row_mask[r] |= bit;
        col_mask[c] |= bit;
        box_mask[box_indices[i]] |= bit;
    }
    return true;
}

bool SudokuSolver::solve(SudokuBoard& target) {
    trace = nullptr;
    rng = nullptr;
    if (!load(target)) return false;
    return solve_recursive(0);
}

SolveTrace SudokuSolver::solveTraced(const SudokuBoard& input) {
    SudokuBoard work = input;
    SolveTrace steps;
    trace = &steps;
    rng = nullptr;

    bool solved = load(work) && solve_recursive(0);
    trace = nullptr;

    if (!solved) {
        CV_LOG_DEBUG(NULL, "traced search exhausted after " << steps.size() << " steps");
        steps.clear();
    }
    return steps;
}

int SudokuSolver::countSolutions(SudokuBoard& target, int limit) {
    CV_Assert(limit >= 1);
    trace = nullptr;
    rng = nullptr;
    if (!load(target)) return 0;
    return count_recursive(0, limit);
}

bool SudokuSolver::solveRandomized(SudokuBoard& target, std::mt19937& engine) {
    trace = nullptr;
    rng = &engine;
    bool solved = load(target) && solve_recursive(0);
    rng = nullptr;
    return solved;
}

// Mark a digit as used in the bitmasks and write it to the board
void SudokuSolver::place(int idx, int val) {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    board->set(r, c, val);
    row_mask[r] |= bit;
    col_mask[c] |= bit;
    box_mask[b] |= bit;

    if (trace) trace->push_back({*board, r, c, val, true});
}

// Unmark a digit (backtracking)
void SudokuSolver::remove(int idx, int val) {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];
    uint16_t bit = 1 << (val - 1);

    board->clear(r, c);
    row_mask[r] &= ~bit;
    col_mask[c] &= ~bit;
    box_mask[b] &= ~bit;

    if (trace) trace->push_back({*board, r, c, val, false});
}

// Bit d-1 is set when digit d can go into the cell (same answer as isValidPlacement)
uint16_t SudokuSolver::get_candidates(int idx) const {
    int r = idx / N;
    int c = idx % N;
    int b = box_indices[idx];

    return ~(row_mask[r] | col_mask[c] | box_mask[b]) & 0x1FF;
}

bool SudokuSolver::solve_recursive(size_t k) {
    if (k == empty_cells.size()) {
        return true; // Complete
    }

    int cell = empty_cells[k];
    uint16_t mask = get_candidates(cell);

    if (rng) {
        std::array<int, 9> digits;
        std::iota(digits.begin(), digits.end(), 1);
        std::shuffle(digits.begin(), digits.end(), *rng);

        for (int val : digits) {
            if (!(mask & (1 << (val - 1)))) continue;
            place(cell, val);
            if (solve_recursive(k + 1)) return true;
            remove(cell, val);
        }
        return false;
    }

    // Lowest set bit first: digits in ascending order
    while (mask) {
        int val = std::countr_zero(mask) + 1;

        place(cell, val);
        if (solve_recursive(k + 1)) {
            return true;
        }
        remove(cell, val);

        mask &= (mask - 1);
    }

    return false; // Exhausted
}

int SudokuSolver::count_recursive(size_t k, int limit) {
    if (k == empty_cells.size()) return 1;

    int cell = empty_cells[k];
    uint16_t mask = get_candidates(cell);
    int count = 0;

    while (mask) {
        int val = std::countr_zero(mask) + 1;

        place(cell, val);
        count += count_recursive(k + 1, limit - count);
        remove(cell, val);

        if (count >= limit) return count;
        mask &= (mask - 1);
    }

    return count;
}

bool solveInstant(SudokuBoard& board) {
    SudokuSolver solver;
    return solver.solve(board);
}

SolveTrace solveTraced(const SudokuBoard& board) {
    SudokuSolver solver;
    return solver.solveTraced(board);
}

int countSolutions(SudokuBoard& board, int limit) {
    SudokuSolver solver;
    return solver.countSolutions(board, limit);
}

SudokuBoard replayTrace(const SudokuBoard& original, const SolveTrace& trace) {
    SudokuBoard board = original;
    for (const auto& step : trace) {
        if (step.placed) board.set(step.row, step.col, step.digit);
        else board.clear(step.row, step.col);
    }
    return board;
}
