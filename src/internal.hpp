#pragma once

#include "castepbin/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace castepbin::internal {

/// Fortran character data with padding (blanks, NULs) removed from both ends.
std::string trim_text(const std::uint8_t* data, std::size_t size);
std::string trim_text(const std::string& s);

/// The section header spelled by a record payload, if it is one: printable ASCII,
/// optionally single-quoted, starting with a letter and containing no lowercase.
std::optional<std::string> header_text(const std::uint8_t* data, std::size_t size);

inline void log(Logger* logger, Logger::Level level, const std::string& msg) {
    if (logger && logger->enabled(level)) logger->write(level, msg);
}

} // namespace castepbin::internal
