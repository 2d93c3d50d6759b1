#pragma once

#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace GF::Compare {

struct NormalizeOptions {
    std::set<std::string, std::less<>> ignoreFields;
    bool                               ignoreOrder      = false;
    bool                               ignoreWhitespace = false;
};

/**
 * Canonicalizes a parsed JSON value so that semantically equal documents compare equal.
 *
 * - Objects lose every key listed in ignoreFields, at any depth.
 * - Arrays are normalized element-wise and, with ignoreOrder, sorted by the compact
 *   dump of each element.
 * - Strings are trimmed and have whitespace runs collapsed when ignoreWhitespace is set.
 * - Floats holding a whole number within int64 range become integers; other numbers,
 *   booleans and null pass through.
 *
 * normalize(normalize(v)) == normalize(v) holds for every v.
 */
class Normalizer {
public:
    Normalizer() = default;
    explicit Normalizer(NormalizeOptions options)
        : options(std::move(options)) {}

    [[nodiscard]] auto normalize(nlohmann::json const& value) const -> nlohmann::json;

    [[nodiscard]] auto shouldIgnoreField(std::string_view field) const -> bool;

private:
    auto normalizeObject(nlohmann::json const& object) const -> nlohmann::json;
    auto normalizeArray(nlohmann::json const& array) const -> nlohmann::json;

    NormalizeOptions options;
};

// Trims and collapses runs of " \t\n\v\f\r" into single spaces.
[[nodiscard]] auto collapseWhitespace(std::string_view text) -> std::string;

} // namespace GF::Compare
