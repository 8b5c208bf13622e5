#include "sudoku_validation.hpp"

#include <algorithm>
#include <charconv>

namespace {

constexpr int N = SudokuBoard::N;
using Grid = std::array<int, SudokuBoard::CELL_COUNT>;

std::string duplicateMessage(int value, const char* scope) {
    return "Duplicate " + std::to_string(value) + " in " + scope;
}

// Grid cells are 0 (empty or unusable) or 1..9
void scanDuplicates(const Grid& g, std::vector<ValidationError>& errors) {
    for (int row = 0; row < N; ++row) {
        for (int col = 0; col < N; ++col) {
            int value = g[row * N + col];
            if (value == 0) continue;

            for (int c = 0; c < N; ++c) {
                if (c != col && g[row * N + c] == value) {
                    errors.push_back({row, col, ErrorCategory::Row, duplicateMessage(value, "row")});
                    break;
                }
            }

            for (int r = 0; r < N; ++r) {
                if (r != row && g[r * N + col] == value) {
                    errors.push_back({row, col, ErrorCategory::Column, duplicateMessage(value, "column")});
                    break;
                }
            }

            int boxRow = row / 3 * 3;
            int boxCol = col / 3 * 3;
            bool found = false;
            for (int r = boxRow; r < boxRow + 3 && !found; ++r) {
                for (int c = boxCol; c < boxCol + 3; ++c) {
                    if ((r != row || c != col) && g[r * N + c] == value) {
                        errors.push_back({row, col, ErrorCategory::Box, duplicateMessage(value, "3x3 box")});
                        found = true;
                        break;
                    }
                }
            }
        }
    }
}

} // namespace

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Row: return "row";
        case ErrorCategory::Column: return "column";
        case ErrorCategory::Box: return "box";
        case ErrorCategory::Invalid: return "invalid";
    }
    return "invalid";
}

std::vector<ValidationError> validateBoard(const SudokuBoard& board) {
    Grid g;
    std::copy(board.cells().begin(), board.cells().end(), g.begin());

    std::vector<ValidationError> errors;
    scanDuplicates(g, errors);
    return errors;
}

std::vector<ValidationError> validateRows(const std::vector<std::vector<int>>& rows) {
    std::vector<ValidationError> errors;
    Grid g;
    g.fill(0);

    for (int r = 0; r < N; ++r) {
        if (r >= (int)rows.size()) {
            errors.push_back({r, 0, ErrorCategory::Invalid, "Missing row " + std::to_string(r + 1)});
            continue;
        }

        const auto& row = rows[r];
        if (row.size() != N) {
            errors.push_back({r, std::min((int)row.size(), N - 1), ErrorCategory::Invalid,
                              "Row " + std::to_string(r + 1) + " has " + std::to_string(row.size()) +
                                  " cells, expected 9"});
        }

        for (int c = 0; c < std::min((int)row.size(), N); ++c) {
            int value = row[c];
            if (value == 0 || isValidNumber(value)) {
                g[r * N + c] = value;
            } else {
                errors.push_back({r, c, ErrorCategory::Invalid, "Invalid value " + std::to_string(value)});
            }
        }
    }

    if (rows.size() > N) {
        errors.push_back({N - 1, 0, ErrorCategory::Invalid,
                          "Board has " + std::to_string(rows.size()) + " rows, expected 9"});
    }

    scanDuplicates(g, errors);
    return errors;
}

bool isValidNumber(int value) {
    return value >= 1 && value <= 9;
}

bool isValidNumber(std::string_view text) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) return false;
    return isValidNumber(value);
}

bool hasError(int row, int col, const std::vector<ValidationError>& errors) {
    return std::any_of(errors.begin(), errors.end(),
                       [row, col](const ValidationError& e) { return e.row == row && e.col == col; });
}
