#include "diff/DiffEngine.hpp"
#include "diff/LineSplitter.hpp"

#include <algorithm>

namespace GF::Diff {

namespace {

enum class EditOp : char {
    Keep   = '=',
    Delete = '-',
    Insert = '+'
};

// Shortest edit script between a and b, front to back.
auto myersEditScript(std::vector<std::string> const& a, std::vector<std::string> const& b) -> std::vector<EditOp> {
    std::vector<EditOp> ops;
    const int           N = static_cast<int>(a.size());
    const int           M = static_cast<int>(b.size());
    if (N == 0 && M == 0) {
        return ops;
    }
    const int                     MAX    = N + M;
    const int                     OFFSET = MAX;
    std::vector<int>              v(2 * MAX + 2, 0);
    std::vector<std::vector<int>> trace;
    trace.reserve(MAX + 1);

    for (int d = 0; d <= MAX; ++d) {
        trace.push_back(v); // snapshot before exploring this D layer
        for (int k = -d; k <= d; k += 2) {
            int x;
            if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
                x = v[OFFSET + k + 1]; // down (insertion)
            } else {
                x = v[OFFSET + k - 1] + 1; // right (deletion)
            }
            int y = x - k;
            while (x < N && y < M && a[x] == b[y]) {
                ++x;
                ++y;
            }
            v[OFFSET + k] = x;
            if (x < N || y < M) {
                continue;
            }

            std::vector<EditOp> reversed;
            int                 cx = N;
            int                 cy = M;
            for (int dd = d; dd >= 0; --dd) {
                auto const& vv = trace[dd];
                int const   kk = cx - cy;
                bool        down;
                int         prevK;
                if (kk == -dd || (kk != dd && vv[OFFSET + kk - 1] < vv[OFFSET + kk + 1])) {
                    prevK = kk + 1;
                    down  = true;
                } else {
                    prevK = kk - 1;
                    down  = false;
                }
                int const px = vv[OFFSET + prevK];
                int const py = px - prevK;
                while (cx > px && cy > py) {
                    reversed.push_back(EditOp::Keep);
                    --cx;
                    --cy;
                }
                if (dd > 0) {
                    reversed.push_back(down ? EditOp::Insert : EditOp::Delete);
                }
                cx = px;
                cy = py;
            }
            ops.assign(reversed.rbegin(), reversed.rend());
            return ops;
        }
    }
    return ops;
}

auto equalChunk(std::string const& line, std::size_t ia, std::size_t ib) -> DiffChunk {
    return DiffChunk{.type = ChunkType::Equal, .lines = {line}, .startA = ia, .startB = ib, .countA = 1, .countB = 1};
}

auto deleteChunk(std::string const& line, std::size_t ia, std::size_t ib) -> DiffChunk {
    return DiffChunk{.type = ChunkType::Delete, .lines = {line}, .startA = ia, .startB = ib, .countA = 1, .countB = 0};
}

auto insertChunk(std::string const& line, std::size_t ia, std::size_t ib) -> DiffChunk {
    return DiffChunk{.type = ChunkType::Insert, .lines = {line}, .startA = ia, .startB = ib, .countA = 0, .countB = 1};
}

auto replaceChunk(std::string const& expectedLine, std::string const& actualLine, std::size_t ia, std::size_t ib)
    -> DiffChunk {
    return DiffChunk{.type   = ChunkType::Replace,
                     .lines  = {expectedLine, actualLine},
                     .startA = ia,
                     .startB = ib,
                     .countA = 1,
                     .countB = 1};
}

} // namespace

auto DiffEngine::diff(std::string_view expected, std::string_view actual) const -> DiffResult {
    return this->diffLines(splitLines(expected), splitLines(actual));
}

auto DiffEngine::diffLines(std::vector<std::string> const& expected, std::vector<std::string> const& actual) const
    -> DiffResult {
    switch (this->options.algorithm) {
    case DiffAlgorithm::Myers:
        return myersDiff(expected, actual);
    case DiffAlgorithm::Simple:
        return simpleDiff(expected, actual);
    }
    return simpleDiff(expected, actual);
}

auto simpleDiff(std::vector<std::string> const& expected, std::vector<std::string> const& actual) -> DiffResult {
    DiffResult  result;
    auto const  maxLen = std::max(expected.size(), actual.size());
    result.chunks.reserve(maxLen);

    for (std::size_t i = 0; i < maxLen; ++i) {
        if (i >= expected.size()) {
            result.chunks.push_back(insertChunk(actual[i], expected.size(), i));
            result.equal = false;
        } else if (i >= actual.size()) {
            result.chunks.push_back(deleteChunk(expected[i], i, actual.size()));
            result.equal = false;
        } else if (expected[i] == actual[i]) {
            result.chunks.push_back(equalChunk(expected[i], i, i));
        } else {
            result.chunks.push_back(replaceChunk(expected[i], actual[i], i, i));
            result.equal = false;
        }
    }
    return result;
}

auto myersDiff(std::vector<std::string> const& expected, std::vector<std::string> const& actual) -> DiffResult {
    DiffResult result;
    auto const ops = myersEditScript(expected, actual);

    std::size_t ia  = 0;
    std::size_t ib  = 0;
    std::size_t pos = 0;
    while (pos < ops.size()) {
        if (ops[pos] == EditOp::Keep) {
            result.chunks.push_back(equalChunk(expected[ia], ia, ib));
            ++ia;
            ++ib;
            ++pos;
            continue;
        }

        // Gather one run of edits between two kept lines.
        std::size_t deletes = 0;
        std::size_t inserts = 0;
        while (pos < ops.size() && ops[pos] != EditOp::Keep) {
            if (ops[pos] == EditOp::Delete)
                ++deletes;
            else
                ++inserts;
            ++pos;
        }
        result.equal = false;

        auto const paired = std::min(deletes, inserts);
        for (std::size_t k = 0; k < paired; ++k) {
            result.chunks.push_back(replaceChunk(expected[ia + k], actual[ib + k], ia + k, ib + k));
        }
        for (std::size_t k = paired; k < deletes; ++k) {
            result.chunks.push_back(deleteChunk(expected[ia + k], ia + k, ib + paired));
        }
        for (std::size_t k = paired; k < inserts; ++k) {
            result.chunks.push_back(insertChunk(actual[ib + k], ia + deletes, ib + k));
        }
        ia += deletes;
        ib += inserts;
    }
    return result;
}

} // namespace GF::Diff
