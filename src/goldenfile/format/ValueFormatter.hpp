#pragma once

#include <concepts>
#include <cstddef>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

namespace GF::Format {

// Re-emits JSON-shaped text with two-space indentation; anything else comes back as is.
[[nodiscard]] auto formatText(std::string_view text) -> std::string;
[[nodiscard]] auto formatJson(nlohmann::json const& value) -> std::string;
[[nodiscard]] auto formatBytes(std::span<const std::byte> bytes) -> std::string;

template <typename T>
concept Streamable = requires(std::ostream& os, T const& value) { os << value; };

template <typename T>
concept JsonConvertible = std::is_constructible_v<nlohmann::json, T const&>;

template <typename T>
inline constexpr bool kUnformattable = false;

/**
 * Turns a value into the bytes stored in a golden file.
 *
 * JSON documents and JSON-convertible types are indented by two spaces, text that looks
 * like JSON is reformatted the same way, other text passes through, and anything that
 * only supports operator<< is streamed.
 */
template <typename T>
[[nodiscard]] auto formatValue(T const& value) -> std::string {
    if constexpr (std::is_same_v<T, nlohmann::json>) {
        return formatJson(value);
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return "null";
    } else if constexpr (std::is_same_v<T, std::vector<std::byte>>) {
        return formatBytes(std::span<const std::byte>(value.data(), value.size()));
    } else if constexpr (std::is_convertible_v<T const&, std::string_view>) {
        return formatText(std::string_view(value));
    } else if constexpr (JsonConvertible<T>) {
        return formatJson(nlohmann::json(value));
    } else if constexpr (Streamable<T>) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        static_assert(kUnformattable<T>, "formatValue needs a JSON conversion or operator<< for this type");
    }
}

} // namespace GF::Format
