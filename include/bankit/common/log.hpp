#pragma once

#include <string>

#include "error.hpp"

namespace bankit::log {

    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    /// Route log lines to a file (appended) at or above the given level
    /// Error lines are also echoed to std::cerr
    /// @param path Log file path, empty keeps file logging disabled
    /// @param level Minimum level written to the file
    dp::Result<void, dp::Error> configure(const std::string &path, Level level);

    /// Close the log file; later lines only reach std::cerr
    void shutdown();

    dp::Result<Level, dp::Error> parseLevel(const std::string &name);
    const char *levelName(Level level);

    void write(Level level, const std::string &message);

    inline void debug(const std::string &message) { write(Level::Debug, message); }
    inline void info(const std::string &message) { write(Level::Info, message); }
    inline void warn(const std::string &message) { write(Level::Warn, message); }
    inline void error(const std::string &message) { write(Level::Error, message); }

} // namespace bankit::log
