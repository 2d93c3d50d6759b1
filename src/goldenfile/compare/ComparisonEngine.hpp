#pragma once

#include "compare/Normalizer.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace GF::Compare {

using CustomCompareFn = std::function<bool(std::string_view expected, std::string_view actual)>;

struct CompareOptions {
    bool                               ignoreOrder      = false;
    bool                               ignoreWhitespace = false;
    std::set<std::string, std::less<>> ignoreFields;
    CustomCompareFn                    customCompare;
};

struct CompareResult {
    bool        equal = false;
    std::string details;
};

inline constexpr std::string_view kDetailsCustom = "Custom comparison function";
inline constexpr std::string_view kDetailsJson   = "JSON semantic comparison";
inline constexpr std::string_view kDetailsText   = "Text comparison with preprocessing";

/**
 * Decides whether two artifacts are equivalent.
 *
 * A configured customCompare wins outright. Otherwise both sides are compared as JSON
 * when each starts (after leading whitespace) with '{' or '[', and as text otherwise.
 * Malformed JSON yields an unequal result whose details name the side that failed.
 * compare() never throws and touches no shared state.
 */
class ComparisonEngine {
public:
    ComparisonEngine() = default;
    explicit ComparisonEngine(CompareOptions options);

    [[nodiscard]] auto compare(std::string_view expected, std::string_view actual) const -> CompareResult;

    [[nodiscard]] auto options() const -> CompareOptions const& { return this->compareOptions; }

private:
    auto compareJson(std::string_view expected, std::string_view actual) const -> CompareResult;
    auto compareText(std::string_view expected, std::string_view actual) const -> CompareResult;
    auto preprocessText(std::string_view text) const -> std::string;

    CompareOptions compareOptions;
    Normalizer     normalizer;
};

// True when the first non-whitespace byte is '{' or '['.
[[nodiscard]] auto looksLikeJson(std::string_view data) -> bool;

// Structural equality over normalized trees: same kinds, same key sets, pointwise equal.
[[nodiscard]] auto jsonDeepEqual(nlohmann::json const& lhs, nlohmann::json const& rhs) -> bool;

} // namespace GF::Compare
