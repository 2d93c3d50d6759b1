#include "diff/DiffRenderer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace GF::Diff {

namespace {

auto paddedNumber(std::size_t lineNumber) -> std::string {
    std::ostringstream oss;
    oss << std::setw(4) << lineNumber;
    return oss.str();
}

// Marks which chunks survive context folding.
auto visibleChunks(DiffResult const& diff, std::optional<std::size_t> contextLines) -> std::vector<bool> {
    auto const        count = diff.chunks.size();
    std::vector<bool> visible(count, !contextLines.has_value());
    if (!contextLines) {
        return visible;
    }
    auto const radius = *contextLines;
    for (std::size_t i = 0; i < count; ++i) {
        if (diff.chunks[i].type == ChunkType::Equal) {
            continue;
        }
        auto const first = i > radius ? i - radius : 0;
        auto const last  = std::min(count - 1, i + radius);
        for (auto j = first; j <= last; ++j) {
            visible[j] = true;
        }
    }
    return visible;
}

} // namespace

auto DiffRenderer::render(DiffResult const& diff) const -> std::string {
    if (diff.equal) {
        return {};
    }

    std::string out;
    auto const  visible = visibleChunks(diff, this->options.contextLines);
    std::size_t folded  = 0;

    auto flushFolded = [&]() {
        if (folded == 0)
            return;
        out += "@@ ... " + std::to_string(folded) + " unchanged lines ... @@\n";
        folded = 0;
    };

    for (std::size_t i = 0; i < diff.chunks.size(); ++i) {
        auto const& chunk = diff.chunks[i];
        if (!visible[i]) {
            ++folded;
            continue;
        }
        flushFolded();

        switch (chunk.type) {
        case ChunkType::Equal:
            for (std::size_t n = 0; n < chunk.lines.size(); ++n)
                this->writeEqualLine(out, chunk.lines[n], chunk.startA + n + 1);
            break;
        case ChunkType::Delete:
            for (std::size_t n = 0; n < chunk.lines.size(); ++n)
                this->writeDeleteLine(out, chunk.lines[n], chunk.startA + n + 1);
            break;
        case ChunkType::Insert:
            for (std::size_t n = 0; n < chunk.lines.size(); ++n)
                this->writeInsertLine(out, chunk.lines[n], chunk.startB + n + 1);
            break;
        case ChunkType::Replace:
            // Both halves share the expected side's line number.
            this->writeDeleteLine(out, chunk.lines.at(0), chunk.startA + 1);
            this->writeInsertLine(out, chunk.lines.at(1), chunk.startA + 1);
            break;
        }
    }
    flushFolded();
    return out;
}

auto DiffRenderer::writeEqualLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void {
    if (this->options.showLineNumbers) {
        out += ' ' + paddedNumber(lineNumber) + "  " + line + '\n';
    } else {
        out += "  " + line + '\n';
    }
}

auto DiffRenderer::writeDeleteLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void {
    this->writeMarkedLine(out, '-', kColorRed, line, lineNumber);
}

auto DiffRenderer::writeInsertLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void {
    this->writeMarkedLine(out, '+', kColorGreen, line, lineNumber);
}

auto DiffRenderer::writeMarkedLine(std::string& out,
                                   char marker,
                                   char const* color,
                                   std::string const& line,
                                   std::size_t lineNumber) const -> void {
    if (this->options.colorOutput)
        out += color;
    out += marker;
    if (this->options.showLineNumbers) {
        out += paddedNumber(lineNumber) + "  ";
    } else {
        out += ' ';
    }
    out += line;
    if (this->options.colorOutput)
        out += kColorReset;
    out += '\n';
}

} // namespace GF::Diff
