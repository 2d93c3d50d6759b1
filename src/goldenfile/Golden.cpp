#include "Golden.hpp"
#include "log/TaggedLogger.hpp"

#include <set>
#include <utility>

namespace GF {

namespace {

constexpr std::size_t kRuleWidth = 80;

auto makeCompareOptions(GoldenOptions const& options) -> Compare::CompareOptions {
    return Compare::CompareOptions{
        .ignoreOrder      = options.ignoreOrder,
        .ignoreWhitespace = options.ignoreWhitespace,
        .ignoreFields     = std::set<std::string, std::less<>>(options.ignoreFields.begin(), options.ignoreFields.end()),
        .customCompare    = options.customCompare};
}

auto repeat(std::string_view unit, std::size_t count) -> std::string {
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i)
        out.append(unit);
    return out;
}

} // namespace

Golden::Golden(GoldenOptions options, std::source_location location)
    : Golden(std::move(options), Format::resolveCaller(location)) {}

Golden::Golden(GoldenOptions options, Format::CallerIdentity caller)
    : goldenOptions(std::move(options)),
      callerIdentity{std::move(caller.originFile), Format::fileSafeTestName(caller.originTest)},
      baseDir(resolveBaseDir(goldenOptions.dir)),
      naming(goldenOptions.naming ? goldenOptions.naming
                                   : std::shared_ptr<Store::NamingStrategy const>(std::make_shared<Store::DefaultNaming>())),
      store(Store::StoreOptions{.maxFileSize = goldenOptions.maxFileSize, .fsync = goldenOptions.fsync}),
      comparator(makeCompareOptions(goldenOptions)),
      differ(Diff::DiffOptions{.algorithm = goldenOptions.algorithm}),
      renderer(Diff::RenderOptions{.contextLines    = goldenOptions.contextLines,
                                   .showLineNumbers = goldenOptions.showLineNumbers,
                                   .colorOutput     = goldenOptions.colorOutput}) {}

auto Golden::identityFor(std::string_view name) const -> Store::GoldenIdentity {
    return Store::GoldenIdentity{.baseDir    = this->baseDir,
                                 .originFile = this->callerIdentity.originFile,
                                 .originTest = this->callerIdentity.originTest,
                                 .artifact   = std::string{name}};
}

auto Golden::pathFor(std::string_view name) const -> std::filesystem::path {
    return Store::resolvePath(this->identityFor(name), *this->naming);
}

auto Golden::assertBytes(std::string_view name, std::string_view actual) const -> Expected<void> {
    if (auto valid = validate(this->goldenOptions); !valid) {
        return valid;
    }
    auto const path = this->pathFor(name);
    if (this->goldenOptions.update) {
        return this->update(path, actual);
    }
    return this->verify(path, actual);
}

auto Golden::update(std::filesystem::path const& path, std::string_view actual) const -> Expected<void> {
    gf_log("Updating golden file " + path.string(), "Golden");
    auto written = this->store.write(path, actual);
    if (!written) {
        auto const& error = written.error();
        return std::unexpected(Error{error.code,
                                     "Failed to write golden file " + path.string() + ": "
                                         + error.message.value_or(std::string{errorCodeToString(error.code)})});
    }
    return {};
}

auto Golden::verify(std::filesystem::path const& path, std::string_view actual) const -> Expected<void> {
    auto expected = this->store.read(path);
    if (!expected) {
        auto const& error = expected.error();
        if (error.code == Error::Code::NotFound) {
            return std::unexpected(Error{Error::Code::NotFound,
                                         "Golden file " + path.string()
                                             + " does not exist. Run with update mode to create it."});
        }
        return std::unexpected(Error{error.code,
                                     "Failed to read golden file " + path.string() + ": "
                                         + error.message.value_or(std::string{errorCodeToString(error.code)})});
    }

    auto const result = this->comparator.compare(*expected, actual);
    if (result.equal) {
        return {};
    }

    gf_log("Golden mismatch in " + path.string() + " (" + result.details + ")", "Golden");
    auto const diff       = this->differ.diff(*expected, actual);
    auto const diffOutput = this->renderer.render(diff);
    return std::unexpected(Error{Error::Code::Mismatch, this->formatMismatch(path, result, diffOutput)});
}

auto Golden::formatMismatch(std::filesystem::path const& path,
                            Compare::CompareResult const& result,
                            std::string const& diffOutput) const -> std::string {
    std::string out;
    if (this->goldenOptions.colorOutput) {
        out += "\xF0\x9F\x94\x8D \033[1;31mGolden test failed\033[0m\n";
        out += "\xF0\x9F\x93\x81 File: \033[1;36m" + path.string() + "\033[0m\n";
        out += "Comparison: " + result.details + "\n";
        out += "\n";
        out += "\xF0\x9F\x94\x84 \033[1;33mDifferences found:\033[0m\n";
        out += repeat("\xE2\x94\x80", kRuleWidth) + "\n";
        out += diffOutput;
        out += repeat("\xE2\x94\x80", kRuleWidth) + "\n";
        out += "\xF0\x9F\x92\xA1 \033[1;32mTip: Run with update mode to accept changes\033[0m\n";
    } else {
        out += "Golden test failed\n";
        out += "File: " + path.string() + "\n";
        out += "Comparison: " + result.details + "\n";
        out += "\n";
        out += "Differences found:\n";
        out += repeat("-", kRuleWidth) + "\n";
        out += diffOutput;
        out += repeat("-", kRuleWidth) + "\n";
        out += "Tip: Run with update mode to accept changes\n";
    }
    return out;
}

} // namespace GF
