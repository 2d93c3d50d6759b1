#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace GF::Store {

struct StoreOptions {
    std::uintmax_t maxFileSize = 50ull * 1024 * 1024;
    bool           fsync       = true;
};

/**
 * Reads and writes whole files under per-path reader/writer locks.
 *
 * Reads of one path may overlap each other but never a write of that path; writes of
 * one path are serialized. Different paths never block each other. Writes go through
 * a temporary sibling and an atomic rename, creating missing parent directories first.
 * All stores in a process share one LockRegistry.
 */
class KeyedFileStore {
public:
    KeyedFileStore() = default;
    explicit KeyedFileStore(StoreOptions options)
        : options(options) {}

    [[nodiscard]] auto read(std::filesystem::path const& path) const -> Expected<std::string>;
    [[nodiscard]] auto write(std::filesystem::path const& path, std::string_view data) const -> Expected<void>;

    // Number of distinct paths that have been locked so far in this process.
    [[nodiscard]] static auto lockCount() -> std::size_t;

    // Key under which path is locked; equivalent spellings of one file share a key.
    [[nodiscard]] static auto lockKey(std::filesystem::path const& path) -> std::string;

private:
    StoreOptions options;
};

} // namespace GF::Store
