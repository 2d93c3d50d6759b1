#pragma once

#include "GoldenOptions.hpp"
#include "compare/ComparisonEngine.hpp"
#include "core/Error.hpp"
#include "diff/DiffEngine.hpp"
#include "diff/DiffRenderer.hpp"
#include "format/CallerIdentity.hpp"
#include "format/ValueFormatter.hpp"
#include "store/KeyedFileStore.hpp"
#include "store/NamingStrategy.hpp"

#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace GF {

/**
 * Golden file assertions for one test.
 *
 * In update mode assert*() stores the actual value as the golden file. Otherwise it
 * loads the golden file and compares; a difference fails with Error::Code::Mismatch
 * and a message holding the file path and the rendered diff. A missing golden file
 * fails with Error::Code::NotFound, other storage problems with IoFailure or
 * CapacityExceeded.
 *
 * The default constructor names golden files after the calling function. Tests whose
 * body is generated by a framework macro get the fallback identity and should pass a
 * CallerIdentity instead; '_' in its test name is stored as '-'.
 *
 * Instances may be used from several threads; concurrent access to one golden file is
 * serialized by the store.
 */
class Golden {
public:
    explicit Golden(GoldenOptions options = {}, std::source_location location = std::source_location::current());
    Golden(GoldenOptions options, Format::CallerIdentity caller);

    template <typename T>
    [[nodiscard]] auto assertValue(std::string_view name, T const& actual) const -> Expected<void> {
        return this->assertBytes(name, Format::formatValue(actual));
    }

    [[nodiscard]] auto assertBytes(std::string_view name, std::string_view actual) const -> Expected<void>;

    [[nodiscard]] auto identityFor(std::string_view name) const -> Store::GoldenIdentity;
    [[nodiscard]] auto pathFor(std::string_view name) const -> std::filesystem::path;

    [[nodiscard]] auto options() const -> GoldenOptions const& { return this->goldenOptions; }
    [[nodiscard]] auto caller() const -> Format::CallerIdentity const& { return this->callerIdentity; }

private:
    auto update(std::filesystem::path const& path, std::string_view actual) const -> Expected<void>;
    auto verify(std::filesystem::path const& path, std::string_view actual) const -> Expected<void>;
    auto formatMismatch(std::filesystem::path const& path,
                        Compare::CompareResult const& result,
                        std::string const& diffOutput) const -> std::string;

    GoldenOptions                                goldenOptions;
    Format::CallerIdentity                       callerIdentity;
    std::filesystem::path                        baseDir;
    std::shared_ptr<Store::NamingStrategy const> naming;
    Store::KeyedFileStore                        store;
    Compare::ComparisonEngine                    comparator;
    Diff::DiffEngine                             differ;
    Diff::DiffRenderer                           renderer;
};

} // namespace GF
