#include "compare/ComparisonEngine.hpp"

#include <utility>

namespace GF::Compare {

namespace {

auto isSpace(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

} // namespace

auto looksLikeJson(std::string_view data) -> bool {
    for (char ch : data) {
        if (isSpace(ch))
            continue;
        return ch == '{' || ch == '[';
    }
    return false;
}

auto jsonDeepEqual(nlohmann::json const& lhs, nlohmann::json const& rhs) -> bool {
    // Integer and floating point encodings of the same number are the same JSON number.
    if (lhs.is_number() && rhs.is_number()) {
        return lhs == rhs;
    }
    if (lhs.type() != rhs.type()) {
        return false;
    }
    switch (lhs.type()) {
    case nlohmann::json::value_t::object: {
        if (lhs.size() != rhs.size())
            return false;
        for (auto const& [key, value] : lhs.items()) {
            auto it = rhs.find(key);
            if (it == rhs.end() || !jsonDeepEqual(value, *it))
                return false;
        }
        return true;
    }
    case nlohmann::json::value_t::array: {
        if (lhs.size() != rhs.size())
            return false;
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (!jsonDeepEqual(lhs[i], rhs[i]))
                return false;
        }
        return true;
    }
    default:
        return lhs == rhs;
    }
}

ComparisonEngine::ComparisonEngine(CompareOptions options)
    : compareOptions(std::move(options)),
      normalizer(NormalizeOptions{.ignoreFields     = compareOptions.ignoreFields,
                                  .ignoreOrder      = compareOptions.ignoreOrder,
                                  .ignoreWhitespace = compareOptions.ignoreWhitespace}) {}

auto ComparisonEngine::compare(std::string_view expected, std::string_view actual) const -> CompareResult {
    if (this->compareOptions.customCompare) {
        return CompareResult{.equal   = this->compareOptions.customCompare(expected, actual),
                             .details = std::string{kDetailsCustom}};
    }

    if (looksLikeJson(expected) && looksLikeJson(actual)) {
        return this->compareJson(expected, actual);
    }
    return this->compareText(expected, actual);
}

auto ComparisonEngine::compareJson(std::string_view expected, std::string_view actual) const -> CompareResult {
    auto expectedValue = nlohmann::json::parse(expected, nullptr, false);
    if (expectedValue.is_discarded()) {
        return CompareResult{.equal = false, .details = "Failed to parse expected JSON"};
    }
    auto actualValue = nlohmann::json::parse(actual, nullptr, false);
    if (actualValue.is_discarded()) {
        return CompareResult{.equal = false, .details = "Failed to parse actual JSON"};
    }

    auto const expectedNormalized = this->normalizer.normalize(expectedValue);
    auto const actualNormalized   = this->normalizer.normalize(actualValue);

    return CompareResult{.equal   = jsonDeepEqual(expectedNormalized, actualNormalized),
                         .details = std::string{kDetailsJson}};
}

auto ComparisonEngine::compareText(std::string_view expected, std::string_view actual) const -> CompareResult {
    return CompareResult{.equal   = this->preprocessText(expected) == this->preprocessText(actual),
                         .details = std::string{kDetailsText}};
}

auto ComparisonEngine::preprocessText(std::string_view text) const -> std::string {
    if (this->compareOptions.ignoreWhitespace) {
        return collapseWhitespace(text);
    }
    return std::string{text};
}

} // namespace GF::Compare
