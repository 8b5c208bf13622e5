#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <opencv2/core.hpp>

#include "constraint_checker.hpp"

TEST_CASE("placement is checked against row, column and box", "[constraints]") {
    SudokuBoard board;
    board.set(4, 4, 5);

    CHECK_FALSE(isValidPlacement(board, 4, 0, 5)); // row
    CHECK_FALSE(isValidPlacement(board, 0, 4, 5)); // column
    CHECK_FALSE(isValidPlacement(board, 3, 3, 5)); // box
    CHECK_FALSE(isValidPlacement(board, 5, 5, 5));

    CHECK(isValidPlacement(board, 3, 0, 5));
    CHECK(isValidPlacement(board, 6, 6, 5));
    CHECK(isValidPlacement(board, 4, 0, 6));
}

TEST_CASE("placements on the example puzzle", "[constraints]") {
    SudokuBoard board = examplePuzzle();

    CHECK(isValidPlacement(board, 0, 2, 1));
    CHECK(isValidPlacement(board, 0, 2, 4));
    CHECK_FALSE(isValidPlacement(board, 0, 2, 7)); // row 0
    CHECK_FALSE(isValidPlacement(board, 0, 2, 8)); // column 2
    CHECK_FALSE(isValidPlacement(board, 0, 2, 9)); // top-left box only
}

TEST_CASE("box origin follows the cell", "[constraints]") {
    SudokuBoard board;
    board.set(8, 8, 1);

    CHECK_FALSE(isValidPlacement(board, 6, 6, 1));
    CHECK(isValidPlacement(board, 5, 5, 1));
    CHECK(isValidPlacement(board, 6, 5, 1));
}

TEST_CASE("placement rejects out-of-range arguments", "[constraints]") {
    SudokuBoard board;

    CHECK_THROWS_AS(isValidPlacement(board, 0, 0, 0), cv::Exception);
    CHECK_THROWS_AS(isValidPlacement(board, 0, 0, 10), cv::Exception);
    CHECK_THROWS_AS(isValidPlacement(board, 9, 0, 1), cv::Exception);
    CHECK_THROWS_AS(isValidPlacement(board, 0, -1, 1), cv::Exception);
}

TEST_CASE("related cells cover row, column and box once", "[constraints]") {
    auto related = relatedCells(4, 4);
    auto contains = [&related](int r, int c) {
        return std::find(related.begin(), related.end(), CellPos{r, c}) != related.end();
    };

    CHECK(related.size() == 21);
    CHECK(contains(4, 4));
    CHECK(contains(4, 0));
    CHECK(contains(0, 4));
    CHECK(contains(3, 3));
    CHECK(contains(5, 5));
    CHECK_FALSE(contains(0, 0));
    CHECK_FALSE(contains(3, 6));

    CHECK(relatedCells(0, 0).size() == 21);
}
