#include <bankit/common/log.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bankit::log {

    namespace {

        struct Sink {
            std::mutex mutex;
            std::ofstream file;
            Level level = Level::Debug;
        };

        Sink &sink() {
            static Sink instance;
            return instance;
        }

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            auto millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

            std::tm local{};
            localtime_r(&seconds, &local);

            std::ostringstream oss;
            oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << millis;
            return oss.str();
        }

    } // namespace

    dp::Result<void, dp::Error> configure(const std::string &path, Level level) {
        auto &s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);

        if (s.file.is_open())
            s.file.close();
        s.level = level;

        if (path.empty())
            return dp::Result<void, dp::Error>::ok();

        s.file.open(path, std::ios::app);
        if (!s.file.is_open())
            return dp::Result<void, dp::Error>::err(storage_failure(dp::String(("Cannot open log file " + path).c_str())));
        return dp::Result<void, dp::Error>::ok();
    }

    void shutdown() {
        auto &s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open())
            s.file.close();
    }

    dp::Result<Level, dp::Error> parseLevel(const std::string &name) {
        if (name == "debug")
            return dp::Result<Level, dp::Error>::ok(Level::Debug);
        if (name == "info")
            return dp::Result<Level, dp::Error>::ok(Level::Info);
        if (name == "warn" || name == "warning")
            return dp::Result<Level, dp::Error>::ok(Level::Warn);
        if (name == "error")
            return dp::Result<Level, dp::Error>::ok(Level::Error);
        return dp::Result<Level, dp::Error>::err(invalid_input(dp::String(("Unknown log level: " + name).c_str())));
    }

    const char *levelName(Level level) {
        switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARNING";
        case Level::Error:
            return "ERROR";
        }
        return "INFO";
    }

    void write(Level level, const std::string &message) {
        auto &s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);

        if (s.file.is_open() && level >= s.level) {
            s.file << timestamp() << " - " << levelName(level) << " - " << message << std::endl;
        }
        if (level >= Level::Error) {
            std::cerr << levelName(level) << ": " << message << std::endl;
        }
    }

} // namespace bankit::log
