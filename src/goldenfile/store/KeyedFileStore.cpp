#include "store/KeyedFileStore.hpp"
#include "log/TaggedLogger.hpp"
#include "store/FileUtils.hpp"
#include "store/LockRegistry.hpp"

#include <mutex>
#include <shared_mutex>
#include <system_error>

namespace GF::Store {

auto KeyedFileStore::lockKey(std::filesystem::path const& path) -> std::string {
    std::error_code ec;
    auto            absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

auto KeyedFileStore::lockCount() -> std::size_t {
    return LockRegistry::instance().size();
}

auto KeyedFileStore::read(std::filesystem::path const& path) const -> Expected<std::string> {
    auto&                               lock = LockRegistry::instance().lockFor(lockKey(path));
    std::shared_lock<std::shared_mutex> guard(lock);
    gf_log("KeyedFileStore::read " + path.string(), "KeyedFileStore");
    return FileUtils::readFile(path, this->options.maxFileSize);
}

auto KeyedFileStore::write(std::filesystem::path const& path, std::string_view data) const -> Expected<void> {
    auto&                               lock = LockRegistry::instance().lockFor(lockKey(path));
    std::unique_lock<std::shared_mutex> guard(lock);
    gf_log("KeyedFileStore::write " + path.string() + " (" + std::to_string(data.size()) + " bytes)",
           "KeyedFileStore");
    auto result = FileUtils::writeFileAtomic(path, data, this->options.fsync);
    if (!result) {
        gf_log("KeyedFileStore::write failed: " + describeError(result.error()), "KeyedFileStore", "ERROR");
    }
    return result;
}

} // namespace GF::Store
