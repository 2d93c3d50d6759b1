#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace GF::Store::FileUtils {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

[[nodiscard]] auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void>;

// Sibling of path used as the staging file of an atomic write.
[[nodiscard]] auto temporarySibling(std::filesystem::path const& path) -> std::filesystem::path;

/**
 * Writes data next to path and renames it over path, so readers see either the old
 * or the new content in full. The temporary file is removed when any step fails.
 * With fsyncData the file is synced before the rename and its directory after it; a
 * failure of the directory sync is logged and the write still succeeds.
 */
[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path,
                                   std::string_view data,
                                   bool fsyncData) -> Expected<void>;

// NotFound when path does not exist, CapacityExceeded above maxSize, IoFailure otherwise.
[[nodiscard]] auto readFile(std::filesystem::path const& path, std::uintmax_t maxSize) -> Expected<std::string>;

void removePathIfExists(std::filesystem::path const& path);

} // namespace GF::Store::FileUtils
