#include "trace_player.hpp"

#include <opencv2/core.hpp>
#include <utility>

TracePlayer::TracePlayer(SudokuBoard start, SolveTrace trace)
    : original(std::move(start)), steps(std::move(trace)) {}

bool TracePlayer::next() {
    if (step >= steps.size()) return false;
    ++step;
    return true;
}

bool TracePlayer::prev() {
    if (step == 0) return false;
    --step;
    return true;
}

void TracePlayer::seek(size_t target) {
    if (target > steps.size())
        CV_Error(cv::Error::StsOutOfRange,
                 cv::format("step %zu is past the end of a %zu-step trace", target, steps.size()));
    step = target;
}

const SudokuBoard& TracePlayer::board() const {
    return step == 0 ? original : steps[step - 1].board;
}

std::optional<Placement> TracePlayer::current() const {
    if (step == 0) return std::nullopt;
    return steps[step - 1];
}

std::optional<CellPos> TracePlayer::activeCell() const {
    if (step == 0) return std::nullopt;
    return CellPos{steps[step - 1].row, steps[step - 1].col};
}
