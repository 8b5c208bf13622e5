#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include "sudoku_board.hpp"

enum class Difficulty { Easy, Medium, Hard };

// Cells to dig out of a full grid: easy 40, medium 50, hard 57
int removalTarget(Difficulty difficulty);
std::string toString(Difficulty difficulty);
// Accepts "easy", "medium", "hard" (any case); throws cv::Exception otherwise
Difficulty parseDifficulty(std::string_view name);

struct GeneratedPuzzle {
    SudokuBoard puzzle;
    SudokuBoard solution;
    int removed;
};

/**
 * Builds puzzles with exactly one solution.
 * A random complete grid is filled first, then cells are cleared in random
 * order as long as the puzzle keeps a single solution. The difficulty only
 * sets how many cells the digger tries to clear; a grid that resists further
 * thinning ends up with fewer removals.
 */
class SudokuGenerator {
public:
    SudokuGenerator();
    explicit SudokuGenerator(uint32_t seed);

    GeneratedPuzzle generate(Difficulty difficulty);

    SudokuBoard fillGrid();
    int dig(SudokuBoard& board, int cellsToRemove);

private:
    std::mt19937 rng;
};

SudokuBoard generateSudoku(Difficulty difficulty = Difficulty::Medium);
