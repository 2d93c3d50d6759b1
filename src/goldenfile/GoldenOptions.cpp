#include "GoldenOptions.hpp"

#include <cctype>
#include <cstdlib>

namespace GF {

auto updateModeFromEnv() -> bool {
    auto const* value = std::getenv(std::string{kUpdateEnvVar}.c_str());
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);

    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized == "true";
}

auto resolveBaseDir(std::filesystem::path const& dir) -> std::filesystem::path {
    if (dir.empty()) {
        return std::filesystem::path{kDefaultBaseDir};
    }
    if (dir.is_absolute()) {
        return dir;
    }
    if (dir.generic_string().starts_with(kDefaultBaseDir)) {
        return dir;
    }
    return std::filesystem::path{kDefaultBaseDir} / dir;
}

auto validate(GoldenOptions const& options) -> Expected<void> {
    if (options.customCompare && !options.ignoreFields.empty()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "ignoreFields has no effect together with customCompare"});
    }
    if (options.customCompare && options.ignoreWhitespace) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "ignoreWhitespace has no effect together with customCompare"});
    }
    if (options.maxFileSize == 0) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "maxFileSize must be positive"});
    }
    return {};
}

} // namespace GF
