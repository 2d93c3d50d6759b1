#ifdef GF_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace GF {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string normalized;
    for (char ch : std::string_view{value}) {
        if (ch == ' ' || ch == '\t' || ch == '\n')
            continue;
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized.empty()) {
        return true;
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->applyEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::applyEnvironment() -> void {
    if (parse_truthy(std::getenv("GOLDENFILE_LOG_ENABLED")) || parse_truthy(std::getenv("GOLDENFILE_LOG"))) {
        this->loggingEnabled = true;
    }
    if (parse_truthy(std::getenv("GOLDENFILE_LOG_CLEAR_DEFAULT_SKIPS"))) {
        this->skipTags.clear();
    }
    for (auto& tag : split_tags(std::getenv("GOLDENFILE_LOG_SKIP_TAGS"))) {
        this->skipTags.insert(tag);
    }
    this->enabledTags = split_tags(std::getenv("GOLDENFILE_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (this->messageQueue.empty()) {
            return;
        }

        // Take the whole backlog and write it without holding the queue lock.
        std::queue<LogMessage> batch;
        batch.swap(this->messageQueue);
        lock.unlock();
        while (!batch.empty()) {
            if (this->accepts(batch.front().tags)) {
                this->writeToStderr(formatLine(batch.front()));
            }
            batch.pop();
        }
        lock.lock();
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    if (!this->enabledTags.empty()) {
        for (auto const& tag : tags)
            if (!this->enabledTags.contains(tag))
                return false;
    }
    for (auto const& tag : tags)
        if (this->skipTags.contains(tag))
            return false;
    return true;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    std::filesystem::path path{filepath};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

auto TaggedLogger::formatLine(const LogMessage& msg) -> std::string {
    auto const timeT  = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&timeT, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count();
    oss << " [" << join_with_impl(msg.tags, "][") << "] [" << msg.threadName << "] ["
        << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << "] " << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::writeToStderr(std::string const& line) const -> void {
    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto [it, inserted] = threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(nextThreadNumber++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace GF
#endif // GF_LOG_DEBUG
