#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include "board_io.hpp"
#include "cli_config.hpp"
#include "sudoku_board.hpp"
#include "sudoku_generator.hpp"
#include "sudoku_solver.hpp"
#include "sudoku_validation.hpp"
#include "trace_player.hpp"

namespace {

const char* keys =
    "{help h usage ? |        | print this message }"
    "{@command       | example| solve, trace, generate, validate or example }"
    "{@input         |        | board file (.txt, .yml, .json, .xml) }"
    "{difficulty d   |        | easy, medium or hard (generate) }"
    "{seed s         |        | random seed (generate) }"
    "{steps n        |        | trace steps to print }"
    "{output o       |        | save the generated puzzle to this file }"
    "{config c       |        | YAML/JSON file with difficulty, seed, steps, log_level }"
    "{verbose v      |        | debug logging }";

void printBoard(const std::string& title, const SudokuBoard& board) {
    std::cout << title << std::endl;
    std::cout << "---------------------" << std::endl;
    board.print(std::cout);
    std::cout << "---------------------" << std::endl;
}

int runSolve(const SudokuBoard& puzzle) {
    printBoard("Puzzle:", puzzle);

    SudokuBoard board = puzzle;
    auto start = std::chrono::high_resolution_clock::now();
    bool solved = solveInstant(board);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::micro> elapsed = end - start;

    std::cout << "\nStatus: " << (solved ? "Solved" : "Unsolvable") << "\n";
    std::cout << "Time: " << elapsed.count() << " microseconds\n\n";

    if (!solved) {
        std::cout << "Could not solve the sudoku (no completion satisfies the clues)." << std::endl;
        return 1;
    }
    printBoard("Solved Sudoku:", board);
    return 0;
}

int runTrace(const SudokuBoard& puzzle, int stepsToPrint) {
    printBoard("Puzzle:", puzzle);

    auto start = std::chrono::high_resolution_clock::now();
    SolveTrace trace = solveTraced(puzzle);
    auto end = std::chrono::high_resolution_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    if (trace.empty()) {
        // A complete grid needs no steps; anything else without steps has no solution
        SudokuBoard check = puzzle;
        if (puzzle.isComplete() && countSolutions(check) == 1) {
            std::cout << "\nStatus: Already solved" << std::endl;
            return 0;
        }
        std::cout << "\nStatus: Unsolvable (" << ms << " ms)" << std::endl;
        return 1;
    }

    TracePlayer player(puzzle, std::move(trace));
    std::cout << "\nStatus: Solved in " << player.totalSteps() << " steps (" << ms << " ms)\n";

    while ((int)player.currentStep() < stepsToPrint && player.next()) {
        const Placement step = *player.current();
        std::cout << "step " << player.currentStep() << ": " << (step.placed ? "place " : "remove ")
                  << step.digit << " at (" << step.row + 1 << ", " << step.col + 1 << ")\n";
    }
    if (!player.isFinished())
        std::cout << "... " << player.totalSteps() - player.currentStep() << " more steps\n";

    player.seek(player.totalSteps());
    std::cout << std::endl;
    printBoard("Solved Sudoku:", player.board());
    return 0;
}

int runGenerate(const CliConfig& config, const std::string& output) {
    SudokuGenerator generator = config.seed ? SudokuGenerator(*config.seed) : SudokuGenerator();

    auto start = std::chrono::high_resolution_clock::now();
    GeneratedPuzzle result = generator.generate(config.difficulty);
    auto end = std::chrono::high_resolution_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::cout << "Difficulty: " << toString(config.difficulty) << ", clues: " << result.puzzle.clueCount()
              << " (removed " << result.removed << " of " << removalTarget(config.difficulty) << ")\n";
    std::cout << "Generation took: " << ms << " ms\n\n";
    printBoard("Puzzle:", result.puzzle);
    std::cout << result.puzzle.toString() << std::endl;

    if (!output.empty()) {
        saveBoard(output, result.puzzle);
        std::cout << "Saved: " << output << std::endl;
    }
    return 0;
}

int runValidate(const std::string& path) {
    std::vector<ValidationError> errors = validateRows(loadRows(path));

    if (errors.empty()) {
        std::cout << "No errors found." << std::endl;
        return 0;
    }
    for (const auto& e : errors) {
        std::cout << "(" << e.row + 1 << ", " << e.col + 1 << ") [" << toString(e.category) << "] "
                  << e.message << "\n";
    }
    std::cout << errors.size() << " error(s) found." << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    cv::CommandLineParser parser(argc, argv, keys);
    parser.about("Sudoku solver and puzzle generator");

    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    try {
        const std::string command = parser.get<std::string>("@command");
        const std::string input = parser.get<std::string>("@input");
        const std::string output = parser.get<std::string>("output");

        CliConfig config;
        if (parser.has("config")) config = loadConfig(parser.get<std::string>("config"), config);
        if (parser.has("difficulty")) config.difficulty = parseDifficulty(parser.get<std::string>("difficulty"));
        if (parser.has("seed")) config.seed = parser.get<unsigned int>("seed");
        if (parser.has("steps")) config.steps = parser.get<int>("steps");
        if (parser.has("verbose")) config.logLevel = cv::utils::logging::LOG_LEVEL_DEBUG;

        if (!parser.check()) {
            parser.printErrors();
            return 2;
        }

        cv::utils::logging::setLogLevel(config.logLevel);
        CV_LOG_INFO(NULL, "command: " << command << ", difficulty: " << toString(config.difficulty)
                    << ", seed: " << (config.seed ? std::to_string(*config.seed) : "random"));

        if (command == "example") return runSolve(examplePuzzle());
        if (command == "generate") return runGenerate(config, output);

        if (command != "solve" && command != "trace" && command != "validate") {
            std::cerr << "Unknown command: " << command << std::endl;
            parser.printMessage();
            return 2;
        }
        if (input.empty()) {
            std::cerr << "Usage: " << argv[0] << " " << command << " <board_file>" << std::endl;
            return 2;
        }

        if (command == "validate") return runValidate(input);

        SudokuBoard puzzle = loadBoard(input);
        if (command == "trace") return runTrace(puzzle, config.steps);
        return runSolve(puzzle);
    } catch (const cv::Exception& e) {
        std::cerr << "Error: " << e.err << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
