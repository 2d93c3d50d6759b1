#pragma once

#include <source_location>
#include <string>
#include <string_view>

namespace GF::Format {

struct CallerIdentity {
    std::string originFile;
    std::string originTest;

    auto operator==(CallerIdentity const&) const -> bool = default;
};

inline constexpr std::string_view kUnknownOriginFile = "unknown_test.cpp";
inline constexpr std::string_view kUnknownOriginTest = "UnknownTest";

/**
 * Derives the owning source file name and function identifier of the call site.
 *
 * '_' in the function name becomes '-' so that the name survives DefaultNaming's
 * '_'-separated file names. Falls back to (kUnknownOriginFile, kUnknownOriginTest)
 * when either part is empty or the function is a body generated by a test framework
 * macro (doctest TEST_CASE, Catch2 TEST_CASE), whose counter-based name changes as
 * tests are added. Such tests pass an explicit CallerIdentity to Golden.
 */
[[nodiscard]] auto resolveCaller(std::source_location location = std::source_location::current()) -> CallerIdentity;

// "void ns::Suite::run(int) const" -> "run"; empty when nothing usable remains.
[[nodiscard]] auto bareFunctionName(std::string_view signature) -> std::string;

// Replaces the file name separator '_' with '-'.
[[nodiscard]] auto fileSafeTestName(std::string_view name) -> std::string;

} // namespace GF::Format
