#include "format/CallerIdentity.hpp"

#include <cctype>
#include <filesystem>

namespace GF::Format {

namespace {

// Cuts the trailing parameter list (and any qualifiers after it). Scans from the end so
// that parenthesized scopes such as "(anonymous namespace)" stay part of the name.
auto stripParameters(std::string_view signature) -> std::string_view {
    int parens = 0;
    int angles = 0;
    for (std::size_t i = signature.size(); i-- > 0;) {
        char const ch = signature[i];
        if (ch == '>')
            ++angles;
        else if (ch == '<' && angles > 0)
            --angles;
        else if (angles == 0 && ch == ')')
            ++parens;
        else if (angles == 0 && ch == '(' && parens > 0 && --parens == 0)
            return signature.substr(0, i);
    }
    return signature;
}

auto stripTemplateArguments(std::string_view name) -> std::string_view {
    if (name.empty() || name.back() != '>')
        return name;
    int depth = 0;
    for (std::size_t i = name.size(); i-- > 0;) {
        if (name[i] == '>')
            ++depth;
        else if (name[i] == '<' && --depth == 0)
            return name.substr(0, i);
    }
    return name;
}

// Test framework macros name their bodies after a counter; such names are not stable.
auto isGeneratedTestName(std::string_view name) -> bool {
    constexpr std::string_view kGeneratedMarkers[] = {"DOCTEST_ANON_", "C_A_T_C_H_T_E_S_T_", "CATCH2_INTERNAL_TEST_"};
    for (auto marker : kGeneratedMarkers) {
        if (name.find(marker) != std::string_view::npos)
            return true;
    }
    return false;
}

} // namespace

auto fileSafeTestName(std::string_view name) -> std::string {
    std::string out{name};
    for (auto& ch : out) {
        if (ch == '_')
            ch = '-';
    }
    return out;
}

auto bareFunctionName(std::string_view signature) -> std::string {
    auto name = stripTemplateArguments(stripParameters(signature));
    if (auto scope = name.rfind("::"); scope != std::string_view::npos) {
        name.remove_prefix(scope + 2);
    }
    if (auto space = name.rfind(' '); space != std::string_view::npos) {
        name.remove_prefix(space + 1);
    }

    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        out.push_back(std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' ? ch : '_');
    }
    return out;
}

auto resolveCaller(std::source_location location) -> CallerIdentity {
    CallerIdentity identity;
    if (auto const* file = location.file_name(); file != nullptr) {
        identity.originFile = std::filesystem::path(file).filename().string();
    }
    if (auto const* function = location.function_name(); function != nullptr) {
        auto const name = bareFunctionName(function);
        if (!isGeneratedTestName(name)) {
            identity.originTest = fileSafeTestName(name);
        }
    }
    if (identity.originFile.empty() || identity.originTest.empty()) {
        return CallerIdentity{std::string{kUnknownOriginFile}, std::string{kUnknownOriginTest}};
    }
    return identity;
}

} // namespace GF::Format
