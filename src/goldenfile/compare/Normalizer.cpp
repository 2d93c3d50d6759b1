#include "compare/Normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

namespace GF::Compare {

namespace {

auto isSpace(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

// Whole-valued floats become integers so that 1 and 1.0 produce the same sort key.
auto canonicalNumber(nlohmann::json const& value) -> nlohmann::json {
    auto const number = value.get<double>();
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (std::isfinite(number) && std::trunc(number) == number && number >= -kInt64Bound && number < kInt64Bound) {
        return static_cast<std::int64_t>(number);
    }
    return value;
}

} // namespace

auto collapseWhitespace(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        if (isSpace(ch)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(ch);
    }
    return out;
}

auto Normalizer::normalize(nlohmann::json const& value) const -> nlohmann::json {
    switch (value.type()) {
    case nlohmann::json::value_t::object:
        return this->normalizeObject(value);
    case nlohmann::json::value_t::array:
        return this->normalizeArray(value);
    case nlohmann::json::value_t::string:
        if (this->options.ignoreWhitespace) {
            return collapseWhitespace(value.get_ref<std::string const&>());
        }
        return value;
    case nlohmann::json::value_t::number_float:
        return canonicalNumber(value);
    default:
        return value;
    }
}

auto Normalizer::shouldIgnoreField(std::string_view field) const -> bool {
    return this->options.ignoreFields.find(field) != this->options.ignoreFields.end();
}

auto Normalizer::normalizeObject(nlohmann::json const& object) const -> nlohmann::json {
    auto normalized = nlohmann::json::object();
    for (auto const& [key, child] : object.items()) {
        if (this->shouldIgnoreField(key)) {
            continue;
        }
        normalized[key] = this->normalize(child);
    }
    return normalized;
}

auto Normalizer::normalizeArray(nlohmann::json const& array) const -> nlohmann::json {
    std::vector<nlohmann::json> elements;
    elements.reserve(array.size());
    for (auto const& element : array) {
        elements.push_back(this->normalize(element));
    }

    if (this->options.ignoreOrder) {
        std::vector<std::pair<std::string, nlohmann::json>> keyed;
        keyed.reserve(elements.size());
        for (auto& element : elements) {
            auto key = element.dump();
            keyed.emplace_back(std::move(key), std::move(element));
        }
        std::stable_sort(keyed.begin(), keyed.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.first < rhs.first;
        });
        elements.clear();
        for (auto& [key, element] : keyed) {
            elements.push_back(std::move(element));
        }
    }

    auto normalized = nlohmann::json::array();
    for (auto& element : elements) {
        normalized.push_back(std::move(element));
    }
    return normalized;
}

} // namespace GF::Compare
