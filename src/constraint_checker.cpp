#include "constraint_checker.hpp"

#include <algorithm>
#include <opencv2/core.hpp>

bool isValidPlacement(const SudokuBoard& board, int row, int col, int digit) {
    CV_Assert(row >= 0 && row < SudokuBoard::N && col >= 0 && col < SudokuBoard::N);
    CV_Assert(digit >= 1 && digit <= 9);

    const auto& g = board.cells();
    constexpr int N = SudokuBoard::N;

    for (int x = 0; x < N; ++x)
        if (g[row * N + x] == digit) return false;

    for (int x = 0; x < N; ++x)
        if (g[x * N + col] == digit) return false;

    int startRow = row - row % SudokuBoard::BOX;
    int startCol = col - col % SudokuBoard::BOX;
    for (int i = 0; i < SudokuBoard::BOX; ++i)
        for (int j = 0; j < SudokuBoard::BOX; ++j)
            if (g[(startRow + i) * N + startCol + j] == digit) return false;

    return true;
}

std::vector<CellPos> relatedCells(int row, int col) {
    CV_Assert(row >= 0 && row < SudokuBoard::N && col >= 0 && col < SudokuBoard::N);

    std::vector<CellPos> related;
    related.reserve(21);
    auto add = [&related](int r, int c) {
        CellPos p{r, c};
        if (std::find(related.begin(), related.end(), p) == related.end()) related.push_back(p);
    };

    for (int c = 0; c < SudokuBoard::N; ++c) add(row, c);
    for (int r = 0; r < SudokuBoard::N; ++r) add(r, col);

    int boxRow = row / SudokuBoard::BOX * SudokuBoard::BOX;
    int boxCol = col / SudokuBoard::BOX * SudokuBoard::BOX;
    for (int r = boxRow; r < boxRow + SudokuBoard::BOX; ++r)
        for (int c = boxCol; c < boxCol + SudokuBoard::BOX; ++c) add(r, c);

    return related;
}
