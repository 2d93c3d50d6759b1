#pragma once

#include "compare/ComparisonEngine.hpp"
#include "core/Error.hpp"
#include "diff/DiffChunk.hpp"
#include "store/NamingStrategy.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GF {

inline constexpr std::string_view kUpdateEnvVar   = "GOLDEN_UPDATE";
inline constexpr std::string_view kDefaultBaseDir = "testdata";

// GOLDEN_UPDATE, trimmed and case-folded, equals "true".
[[nodiscard]] auto updateModeFromEnv() -> bool;

struct GoldenOptions {
    // Write the actual value as the new golden file instead of comparing.
    bool                  update = updateModeFromEnv();
    std::filesystem::path dir    = std::filesystem::path{kDefaultBaseDir};

    bool                     ignoreOrder      = true;
    std::vector<std::string> ignoreFields;
    bool                     ignoreWhitespace = false;
    Compare::CustomCompareFn customCompare;

    std::optional<std::size_t> contextLines;
    bool                       colorOutput     = false;
    bool                       showLineNumbers = true;
    Diff::DiffAlgorithm        algorithm       = Diff::DiffAlgorithm::Simple;

    std::uintmax_t maxFileSize = 50ull * 1024 * 1024;
    bool           fsync       = true;

    // Null selects DefaultNaming.
    std::shared_ptr<Store::NamingStrategy const> naming;
};

/**
 * Places relative directories under testdata/: "" -> testdata, "testdata/x" stays,
 * "x" -> testdata/x. Absolute paths are kept as given.
 */
[[nodiscard]] auto resolveBaseDir(std::filesystem::path const& dir) -> std::filesystem::path;

// InvalidConfiguration for option combinations that cannot all take effect.
[[nodiscard]] auto validate(GoldenOptions const& options) -> Expected<void>;

} // namespace GF
