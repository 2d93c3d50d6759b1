#include "store/FileUtils.hpp"
#include "log/TaggedLogger.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace GF::Store::FileUtils {

namespace {

auto ioError(std::string what, std::filesystem::path const& path, int err) -> Error {
    what += ' ';
    what += path.string();
    if (err != 0) {
        what += ": ";
        what += std::strerror(err);
    }
    return Error{Error::Code::IoFailure, std::move(what)};
}

auto randomToken() -> std::string {
    static std::atomic<std::uint64_t>            counter{0};
    thread_local std::mt19937_64                 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::ostringstream                           oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << (dist(engine) ^ counter.fetch_add(1));
    return oss.str();
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "fsync failed"});
    }
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(ioError("Failed to open directory", dir, errno));
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void> {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(ioError("Failed to create directory", parent, ec.value()));
    }
    return {};
}

auto temporarySibling(std::filesystem::path const& path) -> std::filesystem::path {
    auto tmpPath = path;
    tmpPath += "." + randomToken() + ".tmp";
    return tmpPath;
}

auto writeFileAtomic(std::filesystem::path const& path, std::string_view data, bool fsyncData) -> Expected<void> {
    if (auto dir = ensureParentDirectory(path); !dir) {
        return dir;
    }

    auto const tmpPath = temporarySibling(path);
    int        fd      = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(ioError("Failed to open temporary file", tmpPath, errno));
    }

    std::size_t totalWritten = 0;
    while (totalWritten < data.size()) {
        auto const* ptr       = data.data() + totalWritten;
        auto const  remaining = data.size() - totalWritten;
        auto        written   = ::write(fd, ptr, remaining);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            auto err = errno;
            ::close(fd);
            removePathIfExists(tmpPath);
            return std::unexpected(ioError("Failed to write temporary file", tmpPath, err));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            removePathIfExists(tmpPath);
            return sync;
        }
    }

    if (::close(fd) != 0) {
        auto err = errno;
        removePathIfExists(tmpPath);
        return std::unexpected(ioError("Failed to close temporary file", tmpPath, err));
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        removePathIfExists(tmpPath);
        return std::unexpected(ioError("Failed to rename temporary file onto", path, ec.value()));
    }

    // The content is in place once rename succeeds; a failed directory sync is only logged.
    auto parent = path.parent_path();
    if (fsyncData && !parent.empty()) {
        if (auto syncDir = fsyncDirectory(parent); !syncDir) {
            gf_log("writeFileAtomic: " + describeError(syncDir.error()), "KeyedFileStore", "ERROR");
        }
    }
    return {};
}

auto readFile(std::filesystem::path const& path, std::uintmax_t maxSize) -> Expected<std::string> {
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (!ec || ec == std::errc::no_such_file_or_directory) {
            return std::unexpected(Error{Error::Code::NotFound, "No such file: " + path.string()});
        }
        return std::unexpected(ioError("Failed to stat", path, ec.value()));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(Error{Error::Code::IoFailure, "Not a regular file: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(ioError("Failed to stat", path, ec.value()));
    }
    if (size > maxSize) {
        return std::unexpected(Error{Error::Code::CapacityExceeded,
                                     path.string() + " is " + std::to_string(size) + " bytes, above the limit of "
                                         + std::to_string(maxSize)});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(ioError("Failed to open", path, errno));
    }
    std::string buffer(static_cast<std::size_t>(size), '\0');
    if (size > 0 && !stream.read(buffer.data(), static_cast<std::streamsize>(size))) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read " + path.string()});
    }
    return buffer;
}

void removePathIfExists(std::filesystem::path const& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace GF::Store::FileUtils
