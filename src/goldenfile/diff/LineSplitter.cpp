#include "diff/LineSplitter.hpp"

namespace GF::Diff {

auto splitLines(std::string_view data) -> std::vector<std::string> {
    std::vector<std::string> lines;
    if (data.empty()) {
        return lines;
    }

    std::size_t start = 0;
    while (start < data.size()) {
        auto end = data.find('\n', start);
        if (end == std::string_view::npos) {
            end = data.size();
        }
        auto line = data.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }

    if (data.back() != '\n') {
        lines.emplace_back();
    }
    return lines;
}

} // namespace GF::Diff
