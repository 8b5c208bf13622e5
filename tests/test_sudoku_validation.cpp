#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

#include "board_io.hpp"

#include "sudoku_solver.hpp"
#include "sudoku_validation.hpp"

TEST_CASE("a solved board has no errors", "[validation]") {
    SudokuBoard board = examplePuzzle();
    REQUIRE(solveInstant(board));

    CHECK(validateBoard(board).empty());
    CHECK(validateBoard(examplePuzzle()).empty());
    CHECK(validateBoard(SudokuBoard()).empty());
}

TEST_CASE("two 5's in one row", "[validation]") {
    SudokuBoard board;
    board.set(0, 0, 5);
    board.set(0, 5, 5);

    auto errors = validateBoard(board);
    REQUIRE(errors.size() == 2);

    CHECK(errors[0].row == 0);
    CHECK(errors[0].col == 0);
    CHECK(errors[0].category == ErrorCategory::Row);
    CHECK(errors[0].message == "Duplicate 5 in row");
    CHECK(errors[1].row == 0);
    CHECK(errors[1].col == 5);
    CHECK(errors[1].category == ErrorCategory::Row);

    // The conflicting clues leave no completion
    CHECK_FALSE(solveInstant(board));
}

TEST_CASE("duplicates sharing a row and a box", "[validation]") {
    SudokuBoard board;
    board.set(0, 0, 5);
    board.set(0, 1, 5);

    auto errors = validateBoard(board);
    REQUIRE(errors.size() == 4);
    CHECK(errors[0].category == ErrorCategory::Row);
    CHECK(errors[1].category == ErrorCategory::Box);
    CHECK(errors[1].message == "Duplicate 5 in 3x3 box");
    CHECK(errors[2].col == 1);
    CHECK(errors[3].category == ErrorCategory::Box);
}

TEST_CASE("duplicates in a column", "[validation]") {
    SudokuBoard board;
    board.set(0, 3, 7);
    board.set(8, 3, 7);

    auto errors = validateBoard(board);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0].category == ErrorCategory::Column);
    CHECK(errors[0].message == "Duplicate 7 in column");
    CHECK(errors[1].row == 8);
}

TEST_CASE("one entry per scope for a cell in three conflicts", "[validation]") {
    SudokuBoard board;
    board.set(4, 4, 3);
    board.set(4, 0, 3);
    board.set(4, 8, 3);
    board.set(0, 4, 3);
    board.set(3, 3, 3);

    auto errors = validateBoard(board);
    REQUIRE(errors.size() == 7);

    // Row-major cell order: (0,4) (3,3) (4,0) (4,4) (4,8)
    CHECK(errors[0].row == 0);
    CHECK(errors[0].category == ErrorCategory::Column);
    CHECK(errors[1].row == 3);
    CHECK(errors[1].category == ErrorCategory::Box);
    CHECK(errors[2].col == 0);
    CHECK(errors[2].category == ErrorCategory::Row);

    CHECK(errors[3].col == 4);
    CHECK(errors[3].category == ErrorCategory::Row);
    CHECK(errors[4].category == ErrorCategory::Column);
    CHECK(errors[5].category == ErrorCategory::Box);
    CHECK(errors[6].col == 8);

    CHECK(hasError(4, 4, errors));
    CHECK_FALSE(hasError(0, 0, errors));
}

TEST_CASE("raw rows are accepted as they come", "[validation]") {
    std::vector<std::vector<int>> rows(9, std::vector<int>(9, 0));

    SECTION("clean input") {
        CHECK(validateRows(rows).empty());
    }

    SECTION("out of range values") {
        rows[2][3] = 10;
        rows[6][1] = -4;

        auto errors = validateRows(rows);
        REQUIRE(errors.size() == 2);
        CHECK(errors[0].row == 2);
        CHECK(errors[0].col == 3);
        CHECK(errors[0].category == ErrorCategory::Invalid);
        CHECK(errors[0].message == "Invalid value 10");
        CHECK(errors[1].row == 6);
    }

    SECTION("ragged input still gets the duplicate scan") {
        rows[1].resize(4);
        rows.pop_back();
        rows[0][0] = 5;
        rows[0][8] = 5;

        auto errors = validateRows(rows);
        REQUIRE(errors.size() == 4);
        CHECK(errors[0].row == 1);
        CHECK(errors[0].category == ErrorCategory::Invalid);
        CHECK(errors[1].row == 8);
        CHECK(errors[1].message == "Missing row 9");
        CHECK(errors[2].category == ErrorCategory::Row);
        CHECK(errors[3].col == 8);
    }

    SECTION("extra rows") {
        rows.push_back(std::vector<int>(9, 0));
        auto errors = validateRows(rows);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].category == ErrorCategory::Invalid);
    }

    SECTION("nothing at all") {
        CHECK(validateRows({}).size() == 9);
    }
}

TEST_CASE("a short board string is reported, not rejected", "[validation]") {
    cv::FileStorage storage("{ \"board\": \"53..7\" }", cv::FileStorage::READ | cv::FileStorage::MEMORY);
    auto errors = validateRows(rowsFromFileNode(storage["board"]));

    REQUIRE(errors.size() == 9);
    CHECK(errors[0].row == 0);
    CHECK(errors[0].col == 4);
    CHECK(errors[0].message == "Row 1 has 5 cells, expected 9");
    CHECK(errors[1].message == "Missing row 2");
    for (const auto& e : errors) CHECK(e.category == ErrorCategory::Invalid);
}

TEST_CASE("number input checks", "[validation]") {
    CHECK(isValidNumber(1));
    CHECK(isValidNumber(9));
    CHECK_FALSE(isValidNumber(0));
    CHECK_FALSE(isValidNumber(10));

    CHECK(isValidNumber("5"));
    CHECK_FALSE(isValidNumber("5a"));
    CHECK_FALSE(isValidNumber(""));
    CHECK_FALSE(isValidNumber("-1"));
    CHECK_FALSE(isValidNumber("12"));
}

TEST_CASE("category names", "[validation]") {
    CHECK(toString(ErrorCategory::Row) == "row");
    CHECK(toString(ErrorCategory::Column) == "column");
    CHECK(toString(ErrorCategory::Box) == "box");
    CHECK(toString(ErrorCategory::Invalid) == "invalid");
}
