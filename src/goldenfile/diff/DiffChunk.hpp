#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace GF::Diff {

enum class ChunkType {
    Equal,
    Delete,
    Insert,
    Replace
};

enum class DiffAlgorithm {
    Myers,
    Simple
};

/**
 * One step of a diff between an expected (A) and an actual (B) line sequence.
 *
 * lines holds one entry for Equal/Delete/Insert and exactly two for Replace
 * (expected line first, actual line second). Offsets are zero based and independent
 * per side; a side that contributes nothing has count 0 and start at the position
 * where the other side's lines sit.
 */
struct DiffChunk {
    ChunkType                type = ChunkType::Equal;
    std::vector<std::string> lines;
    std::size_t              startA = 0;
    std::size_t              startB = 0;
    std::size_t              countA = 0;
    std::size_t              countB = 0;

    auto operator==(DiffChunk const&) const -> bool = default;
};

struct DiffResult {
    std::vector<DiffChunk> chunks;
    bool                   equal = true;
};

[[nodiscard]] inline auto chunkTypeToString(ChunkType type) -> std::string_view {
    switch (type) {
    case ChunkType::Equal:
        return "equal";
    case ChunkType::Delete:
        return "delete";
    case ChunkType::Insert:
        return "insert";
    case ChunkType::Replace:
        return "replace";
    }
    return "unknown";
}

} // namespace GF::Diff
