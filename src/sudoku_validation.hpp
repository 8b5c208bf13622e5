#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sudoku_board.hpp"

enum class ErrorCategory { Row, Column, Box, Invalid };

struct ValidationError {
    int row;
    int col;
    ErrorCategory category;
    std::string message;
};

std::string toString(ErrorCategory category);

/**
 * Rule violations of a possibly incomplete board, in row-major cell order.
 * Each filled cell gets at most one entry per scope (row, then column, then
 * box) for the first duplicate of its digit found in that scope. Empty cells
 * never produce entries. Never throws.
 */
std::vector<ValidationError> validateBoard(const SudokuBoard& board);

/**
 * Same scan over a raw matrix taken as-is (e.g. from digit recognition).
 * Missing rows, rows of the wrong length and values outside 0..9 are reported
 * as Invalid; the duplicate scan then runs over the in-range cells. Never throws.
 */
std::vector<ValidationError> validateRows(const std::vector<std::vector<int>>& rows);

bool isValidNumber(int value);
bool isValidNumber(std::string_view text);

bool hasError(int row, int col, const std::vector<ValidationError>& errors);
