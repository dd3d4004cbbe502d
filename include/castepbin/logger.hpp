#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

namespace castepbin {

// Small thread-safe logger. Lines go to stderr (colour tags when it is a terminal)
// and, when a path was given, as plain text to a log file.
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    explicit Logger(Level threshold = Level::Info);
    explicit Logger(const std::string& logfile_path, Level threshold = Level::Info);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(Level level) const noexcept { return level >= threshold_.load(std::memory_order_relaxed); }
    void set_threshold(Level level) noexcept { threshold_.store(level, std::memory_order_relaxed); }
    Level threshold() const noexcept { return threshold_.load(std::memory_order_relaxed); }

    void write(Level level, const std::string& msg);

    void debug(const std::string& m) { write(Level::Debug, m); }
    void info (const std::string& m) { write(Level::Info , m); }
    void warn (const std::string& m) { write(Level::Warn , m); }
    void error(const std::string& m) { write(Level::Error, m); }

    static const char* level_tag(Level level);

private:
    std::ofstream file_;
    std::mutex mtx_;
    std::atomic<Level> threshold_;
};

} // namespace castepbin
