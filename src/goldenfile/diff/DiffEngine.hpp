#pragma once

#include "diff/DiffChunk.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace GF::Diff {

struct DiffOptions {
    DiffAlgorithm algorithm = DiffAlgorithm::Simple;
};

class DiffEngine {
public:
    DiffEngine() = default;
    explicit DiffEngine(DiffOptions options)
        : options(options) {}

    // Splits both buffers with splitLines() and diffs the resulting sequences.
    [[nodiscard]] auto diff(std::string_view expected, std::string_view actual) const -> DiffResult;
    [[nodiscard]] auto diffLines(std::vector<std::string> const& expected,
                                 std::vector<std::string> const& actual) const -> DiffResult;

private:
    DiffOptions options;
};

/**
 * Index aligned comparison: line i of expected is only ever compared with line i of
 * actual. A single inserted line therefore shows up as a run of Replace chunks
 * followed by a trailing Insert.
 */
[[nodiscard]] auto simpleDiff(std::vector<std::string> const& expected,
                              std::vector<std::string> const& actual) -> DiffResult;

/**
 * Myers O(ND) alignment. Runs of deletions directly followed by insertions are paired
 * into Replace chunks, so a changed line renders the same way as in simpleDiff().
 */
[[nodiscard]] auto myersDiff(std::vector<std::string> const& expected,
                             std::vector<std::string> const& actual) -> DiffResult;

} // namespace GF::Diff
