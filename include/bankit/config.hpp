#pragma once

#include <string>

#include <bankit/common/log.hpp>
#include <bankit/storage/sqlite_store.hpp>

namespace bankit {

    /// Process-level settings for a Bank
    struct Config {
        std::string db_path = "bank.db";
        std::string log_path = "debug.log"; // empty disables the log file
        log::Level log_level = log::Level::Debug;
        storage::OpenOptions store;

        Config() = default;

        /// Build a config from command-line flags:
        ///   --db <path>  --log <path>  --no-log  --log-level <debug|info|warn|error>  --no-wal
        /// @return ERR_INVALID_INPUT for an unknown flag or a missing value
        static dp::Result<Config, dp::Error> fromArgs(int argc, const char *const *argv);

        static std::string usage(const std::string &program);
    };

} // namespace bankit
