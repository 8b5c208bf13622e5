#include "board_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string lowerExtension(fs::path p) {
    if (p.extension() == ".gz") p = p.stem();
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

// Text lines with comments dropped
std::vector<std::string> readTextLines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        CV_Error(cv::Error::StsObjectNotFound, "could not open board file " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        lines.push_back(line);
    }
    return lines;
}

bool isLayoutChar(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '|' || ch == '-' || ch == '+';
}

// One row per line of cells, as written. Only characters that are neither
// cells nor layout are rejected.
std::vector<std::vector<int>> rowsFromText(const std::vector<std::string>& lines, const std::string& source) {
    std::vector<std::vector<int>> rows;
    for (const auto& line : lines) {
        std::vector<int> row;
        for (char ch : line) {
            if (isLayoutChar(ch)) continue;
            if (ch == '.') row.push_back(0);
            else if (std::isdigit(static_cast<unsigned char>(ch))) row.push_back(ch - '0');
            else CV_Error(cv::Error::StsParseError, cv::format("unexpected character '%c' in %s", ch, source.c_str()));
        }
        // Separator lines such as ------+-------+------ carry no cells
        if (!row.empty()) rows.push_back(row);
    }

    // A single 81-cell line is the one-line board format
    if (rows.size() == 1 && rows[0].size() == SudokuBoard::CELL_COUNT) {
        std::vector<int> flat = rows[0];
        rows.assign(SudokuBoard::N, std::vector<int>());
        for (int i = 0; i < SudokuBoard::CELL_COUNT; ++i) rows[i / SudokuBoard::N].push_back(flat[i]);
    }
    return rows;
}

} // namespace

bool isStructuredBoardFile(const std::string& path) {
    std::string ext = lowerExtension(path);
    return ext == ".yml" || ext == ".yaml" || ext == ".json" || ext == ".xml";
}

std::vector<std::vector<int>> rowsFromFileNode(const cv::FileNode& node) {
    if (node.empty())
        CV_Error(cv::Error::StsParseError, "missing board node");

    if (node.isString()) {
        std::istringstream text((std::string)node);
        std::vector<std::string> lines;
        for (std::string line; std::getline(text, line);) lines.push_back(line);
        return rowsFromText(lines, "board string");
    }

    if (!node.isSeq())
        CV_Error(cv::Error::StsParseError, "board node must be a sequence of rows or a string");

    std::vector<std::vector<int>> rows;
    for (size_t r = 0; r < node.size(); ++r) {
        cv::FileNode rowNode = node[(int)r];
        if (!rowNode.isSeq())
            CV_Error(cv::Error::StsParseError, cv::format("board row %d is not a sequence", (int)r));

        std::vector<int> row;
        for (size_t c = 0; c < rowNode.size(); ++c) {
            cv::FileNode cell = rowNode[(int)c];
            if (!cell.isInt())
                CV_Error(cv::Error::StsParseError, cv::format("cell (%d, %d) is not an integer", (int)r, (int)c));
            row.push_back((int)cell);
        }
        rows.push_back(row);
    }
    return rows;
}

SudokuBoard boardFromFileNode(const cv::FileNode& node) {
    return SudokuBoard::fromRows(rowsFromFileNode(node));
}

void writeBoard(cv::FileStorage& storage, const std::string& name, const SudokuBoard& board) {
    storage << name << "[";
    for (int r = 0; r < SudokuBoard::N; ++r) {
        storage << "[:";
        for (int c = 0; c < SudokuBoard::N; ++c) storage << board.at(r, c);
        storage << "]";
    }
    storage << "]";
}

std::vector<std::vector<int>> loadRows(const std::string& path) {
    if (!fs::exists(path))
        CV_Error(cv::Error::StsObjectNotFound, "board file " + path + " does not exist");

    if (isStructuredBoardFile(path)) {
        cv::FileStorage storage(path, cv::FileStorage::READ);
        if (!storage.isOpened())
            CV_Error(cv::Error::StsObjectNotFound, "could not open board file " + path);
        return rowsFromFileNode(storage["board"]);
    }

    return rowsFromText(readTextLines(path), path);
}

SudokuBoard loadBoard(const std::string& path) {
    if (isStructuredBoardFile(path))
        return SudokuBoard::fromRows(loadRows(path));

    if (!fs::exists(path))
        CV_Error(cv::Error::StsObjectNotFound, "board file " + path + " does not exist");

    std::ostringstream text;
    for (const auto& line : readTextLines(path)) text << line << '\n';
    return SudokuBoard::fromString(text.str());
}

void saveBoard(const std::string& path, const SudokuBoard& board) {
    if (isStructuredBoardFile(path)) {
        cv::FileStorage storage(path, cv::FileStorage::WRITE);
        if (!storage.isOpened())
            CV_Error(cv::Error::StsError, "could not write board file " + path);
        writeBoard(storage, "board", board);
        storage.release();
        return;
    }

    std::ofstream file(path);
    if (!file.is_open())
        CV_Error(cv::Error::StsError, "could not write board file " + path);
    board.print(file);
}
