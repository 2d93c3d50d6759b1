#pragma once

#include "diff/DiffChunk.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace GF::Diff {

struct RenderOptions {
    // Unchanged lines kept around each change; unset keeps every unchanged line.
    std::optional<std::size_t> contextLines;
    bool                       showLineNumbers = true;
    bool                       colorOutput     = false;
};

class DiffRenderer {
public:
    DiffRenderer() = default;
    explicit DiffRenderer(RenderOptions options)
        : options(options) {}

    // Returns an empty string for an equal diff.
    [[nodiscard]] auto render(DiffResult const& diff) const -> std::string;

private:
    auto writeEqualLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void;
    auto writeDeleteLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void;
    auto writeInsertLine(std::string& out, std::string const& line, std::size_t lineNumber) const -> void;
    auto writeMarkedLine(std::string& out,
                         char marker,
                         char const* color,
                         std::string const& line,
                         std::size_t lineNumber) const -> void;

    RenderOptions options;
};

inline constexpr char const* kColorRed   = "\033[31m";
inline constexpr char const* kColorGreen = "\033[32m";
inline constexpr char const* kColorReset = "\033[0m";

} // namespace GF::Diff
