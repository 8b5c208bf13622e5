#include "sudoku_generator.hpp"

#include <algorithm>
#include <cctype>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <vector>

#include "sudoku_solver.hpp"

int removalTarget(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return 40;   // 41 clues
        case Difficulty::Medium: return 50; // 31 clues
        case Difficulty::Hard: return 57;   // 24 clues
    }
    CV_Error(cv::Error::StsBadArg, "unknown difficulty");
}

std::string toString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    CV_Error(cv::Error::StsBadArg, "unknown difficulty");
}

Difficulty parseDifficulty(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "easy") return Difficulty::Easy;
    if (lower == "medium") return Difficulty::Medium;
    if (lower == "hard") return Difficulty::Hard;
    CV_Error(cv::Error::StsBadArg, "unknown difficulty '" + lower + "' (expected easy, medium or hard)");
}

SudokuGenerator::SudokuGenerator() : rng(std::random_device{}()) {}

SudokuGenerator::SudokuGenerator(uint32_t seed) : rng(seed) {}

SudokuBoard SudokuGenerator::fillGrid() {
    SudokuBoard board;
    SudokuSolver solver;
    // An empty grid always has a completion, so failing here is a solver bug
    if (!solver.solveRandomized(board, rng))
        CV_Error(cv::Error::StsError, "could not fill an empty grid");
    return board;
}

int SudokuGenerator::dig(SudokuBoard& board, int cellsToRemove) {
    CV_Assert(cellsToRemove >= 0 && cellsToRemove <= SudokuBoard::CELL_COUNT);

    std::vector<int> cells(SudokuBoard::CELL_COUNT);
    for (int i = 0; i < SudokuBoard::CELL_COUNT; ++i) cells[i] = i;
    std::shuffle(cells.begin(), cells.end(), rng);

    SudokuSolver solver;
    int removed = 0;

    for (int idx : cells) {
        if (removed >= cellsToRemove) break;

        int r = idx / SudokuBoard::N;
        int c = idx % SudokuBoard::N;
        int backup = board.at(r, c);
        if (backup == SudokuBoard::EMPTY) continue;

        board.clear(r, c);
        // More than one completion: put the digit back
        if (solver.countSolutions(board, 2) != 1) {
            board.set(r, c, backup);
        } else {
            ++removed;
        }
    }

    return removed;
}

GeneratedPuzzle SudokuGenerator::generate(Difficulty difficulty) {
    GeneratedPuzzle result;
    result.solution = fillGrid();
    result.puzzle = result.solution;

    int target = removalTarget(difficulty);
    result.removed = dig(result.puzzle, target);

    CV_LOG_DEBUG(NULL, "generated " << toString(difficulty) << " puzzle: removed " << result.removed
                 << " of " << target << " cells, " << result.puzzle.clueCount() << " clues");
    return result;
}

SudokuBoard generateSudoku(Difficulty difficulty) {
    SudokuGenerator generator;
    return generator.generate(difficulty).puzzle;
}
