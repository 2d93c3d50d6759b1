#include "store/LockRegistry.hpp"

namespace GF::Store {

auto LockRegistry::instance() -> LockRegistry& {
    static LockRegistry registry;
    return registry;
}

auto LockRegistry::lockFor(std::string const& key) -> std::shared_mutex& {
    std::shared_mutex* lock = nullptr;
    this->locks.lazy_emplace_l(
        key,
        [&](LockMap::value_type& entry) { lock = entry.second.get(); },
        [&](auto const& ctor) {
            auto created = std::make_unique<std::shared_mutex>();
            lock         = created.get();
            ctor(key, std::move(created));
        });
    return *lock;
}

auto LockRegistry::size() const -> std::size_t {
    return this->locks.size();
}

} // namespace GF::Store
