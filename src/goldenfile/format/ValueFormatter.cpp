#include "format/ValueFormatter.hpp"
#include "compare/ComparisonEngine.hpp"

namespace GF::Format {

auto formatJson(nlohmann::json const& value) -> std::string {
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto formatText(std::string_view text) -> std::string {
    if (!Compare::looksLikeJson(text)) {
        return std::string{text};
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::string{text};
    }
    return formatJson(parsed);
}

auto formatBytes(std::span<const std::byte> bytes) -> std::string {
    return formatText(std::string_view(reinterpret_cast<char const*>(bytes.data()), bytes.size()));
}

} // namespace GF::Format
