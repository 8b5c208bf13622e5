#pragma once

#include <cstddef>
#include <optional>

#include "sudoku_board.hpp"
#include "sudoku_solver.hpp"

/**
 * Forward/backward stepping over a materialized solve trace.
 * Step 0 shows the original board; step k shows the board right after the
 * k-th recorded placement or removal.
 */
class TracePlayer {
public:
    TracePlayer(SudokuBoard start, SolveTrace trace);

    size_t currentStep() const { return step; }
    size_t totalSteps() const { return steps.size(); }
    bool isFinished() const { return step == steps.size(); }

    bool next();
    bool prev();
    void reset() { step = 0; }
    // Throws cv::Exception when target > totalSteps()
    void seek(size_t target);

    const SudokuBoard& board() const;
    // The record behind the current step, none at step 0
    std::optional<Placement> current() const;
    std::optional<CellPos> activeCell() const;

private:
    SudokuBoard original;
    SolveTrace steps;
    size_t step = 0;
};
