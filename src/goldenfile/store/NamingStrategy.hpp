#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace GF::Store {

/**
 * Logical identity of one golden file: the test that owns it and the artifact name the
 * test chose. baseDir is the directory the file lives in.
 */
struct GoldenIdentity {
    std::filesystem::path baseDir;
    std::string           originFile;
    std::string           originTest;
    std::string           artifact;

    auto operator==(GoldenIdentity const&) const -> bool = default;
};

class NamingStrategy {
public:
    virtual ~NamingStrategy() = default;

    [[nodiscard]] virtual auto generateFilename(std::string_view originFile,
                                                std::string_view originTest,
                                                std::string_view artifact) const -> std::string = 0;

    // The returned identity has an empty baseDir.
    [[nodiscard]] virtual auto parseFilename(std::string_view filename) const -> Expected<GoldenIdentity> = 0;
};

/**
 * <origin-file-stem>_<origin-test>_<artifact>.golden
 *
 * The origin file loses sourceExtension on the way out and gets it back when parsed.
 * The test and artifact names must not contain '_' for parsing to round-trip.
 */
class DefaultNaming final : public NamingStrategy {
public:
    DefaultNaming() = default;
    explicit DefaultNaming(std::string sourceExtension)
        : sourceExtension(std::move(sourceExtension)) {}

    [[nodiscard]] auto generateFilename(std::string_view originFile,
                                        std::string_view originTest,
                                        std::string_view artifact) const -> std::string override;
    [[nodiscard]] auto parseFilename(std::string_view filename) const -> Expected<GoldenIdentity> override;

private:
    std::string sourceExtension = ".cpp";
};

inline constexpr std::string_view kGoldenExtension = ".golden";
inline constexpr char             kNameSeparator   = '_';

[[nodiscard]] auto resolvePath(GoldenIdentity const& identity, NamingStrategy const& naming) -> std::filesystem::path;
[[nodiscard]] auto parsePath(std::filesystem::path const& path, NamingStrategy const& naming) -> Expected<GoldenIdentity>;

} // namespace GF::Store
