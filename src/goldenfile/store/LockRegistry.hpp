#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace GF::Store {

/**
 * Process-wide map from a canonical file path to the shared_mutex guarding it.
 *
 * Entries are created on first use and live until process exit. The key space is
 * bounded by the number of distinct golden files touched in one run, so no eviction
 * happens. Only the insertion of a missing entry takes the (sharded) map lock; the
 * returned mutex is then used without touching the map again.
 */
class LockRegistry {
public:
    static constexpr int DefaultSubmaps = 4;

    using LockMap = phmap::parallel_node_hash_map<
        std::string,
        std::unique_ptr<std::shared_mutex>,
        phmap::Hash<std::string>,
        phmap::EqualTo<std::string>,
        std::allocator<std::pair<const std::string, std::unique_ptr<std::shared_mutex>>>,
        DefaultSubmaps,
        std::mutex>;

    static auto instance() -> LockRegistry&;

    LockRegistry() = default;
    LockRegistry(LockRegistry const&)            = delete;
    LockRegistry& operator=(LockRegistry const&) = delete;

    [[nodiscard]] auto lockFor(std::string const& key) -> std::shared_mutex&;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    LockMap locks;
};

} // namespace GF::Store
