#pragma once

#include <vector>

#include "sudoku_board.hpp"

/**
 * True when digit does not already appear in row, col or the 3x3 box holding
 * (row, col). Meant for cells that do not hold digit yet.
 * Throws cv::Exception for coordinates outside the grid or digits outside 1..9.
 */
bool isValidPlacement(const SudokuBoard& board, int row, int col, int digit);

// Row, column and box peers of (row, col), the cell itself included (21 cells)
std::vector<CellPos> relatedCells(int row, int col);
