#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "sudoku_board.hpp"

/**
 * Board files.
 * .yml/.yaml/.json/.xml (optionally .gz) go through cv::FileStorage and hold a
 * "board" node: either 9 sequences of 9 integers (0 = empty) or a string of 81
 * cells. Anything else is read as plain text ('.' or '0' for empty, '#' starts
 * a comment line).
 */
bool isStructuredBoardFile(const std::string& path);

SudokuBoard loadBoard(const std::string& path);
void saveBoard(const std::string& path, const SudokuBoard& board);

// Raw cell values, no range or shape checks (for validation of untrusted input).
// A board string is split like a text file: one row per line, a single
// 81-cell line reshaped into 9 rows.
std::vector<std::vector<int>> loadRows(const std::string& path);

SudokuBoard boardFromFileNode(const cv::FileNode& node);
std::vector<std::vector<int>> rowsFromFileNode(const cv::FileNode& node);
void writeBoard(cv::FileStorage& storage, const std::string& name, const SudokuBoard& board);
