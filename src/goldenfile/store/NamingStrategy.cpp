#include "store/NamingStrategy.hpp"

#include <vector>

namespace GF::Store {

auto DefaultNaming::generateFilename(std::string_view originFile,
                                     std::string_view originTest,
                                     std::string_view artifact) const -> std::string {
    auto base = originFile;
    if (!this->sourceExtension.empty() && base.ends_with(this->sourceExtension)) {
        base.remove_suffix(this->sourceExtension.size());
    }

    std::string filename;
    filename.reserve(base.size() + originTest.size() + artifact.size() + kGoldenExtension.size() + 2);
    filename.append(base);
    filename.push_back(kNameSeparator);
    filename.append(originTest);
    filename.push_back(kNameSeparator);
    filename.append(artifact);
    filename.append(kGoldenExtension);
    return filename;
}

auto DefaultNaming::parseFilename(std::string_view filename) const -> Expected<GoldenIdentity> {
    if (!filename.ends_with(kGoldenExtension)) {
        return std::unexpected(Error{Error::Code::InvalidPath, "missing .golden extension: " + std::string(filename)});
    }
    auto base = filename.substr(0, filename.size() - kGoldenExtension.size());

    std::vector<std::string_view> parts;
    std::size_t                   start = 0;
    while (true) {
        auto end = base.find(kNameSeparator, start);
        parts.push_back(base.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    if (parts.size() < 3) {
        return std::unexpected(Error{Error::Code::InvalidPath, "invalid filename format: " + std::string(filename)});
    }

    GoldenIdentity identity;
    identity.artifact   = std::string(parts.back());
    identity.originTest = std::string(parts[parts.size() - 2]);
    for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
        if (i > 0)
            identity.originFile.push_back(kNameSeparator);
        identity.originFile.append(parts[i]);
    }
    identity.originFile += this->sourceExtension;
    return identity;
}

auto resolvePath(GoldenIdentity const& identity, NamingStrategy const& naming) -> std::filesystem::path {
    return identity.baseDir / naming.generateFilename(identity.originFile, identity.originTest, identity.artifact);
}

auto parsePath(std::filesystem::path const& path, NamingStrategy const& naming) -> Expected<GoldenIdentity> {
    auto identity = naming.parseFilename(path.filename().string());
    if (!identity) {
        return identity;
    }
    identity->baseDir = path.parent_path();
    return identity;
}

} // namespace GF::Store
