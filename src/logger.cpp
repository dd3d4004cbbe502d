#include "castepbin/logger.hpp"
#include "castepbin/castep_bin.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace castepbin {

#define BG_GRY  "\033[47m"
#define BG_GRN  "\033[102m"
#define BG_YEL  "\033[103m"
#define BG_RED  "\033[101m"
#define RESET   "\033[0m"

// plain tags for the log file and for non-terminal stderr
static const char* bare_tag(Logger::Level l) {
    switch (l) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info:  return "INFO";
        case Logger::Level::Warn:  return "WARN";
        case Logger::Level::Error: return "ERROR";
    }
    return "UNKWN";
}

const char* Logger::level_tag(Level l) {
    if (!isatty(fileno(stderr))) return bare_tag(l);

    switch (l) {
        case Level::Debug: return BG_GRY "DEBUG" RESET;
        case Level::Info:  return BG_GRN "INFO" RESET;
        case Level::Warn:  return BG_YEL "WARN" RESET;
        case Level::Error: return BG_RED "ERROR" RESET;
    }
    return "UNKWN";
}

Logger::Logger(Level threshold) : threshold_(threshold) {}

Logger::Logger(const std::string& logfile_path, Level threshold) : threshold_(threshold) {
    file_.open(logfile_path, std::ios::trunc);
    if (!file_) throw CastepBinError(ErrorKind::Io, "failed to open log file: " + logfile_path);
}

Logger::~Logger() {
    if (file_.is_open()) file_.close();
}

void Logger::write(Level lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::string line = std::string(level_tag(lvl)) + "  " + msg + '\n';
    std::lock_guard<std::mutex> g(mtx_);
    std::cerr << line << std::flush;
    if (file_.is_open()) file_ << bare_tag(lvl) << "  " << msg << '\n';
}

} // namespace castepbin
