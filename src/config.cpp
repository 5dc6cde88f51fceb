#include <bankit/config.hpp>

namespace bankit {

    dp::Result<Config, dp::Error> Config::fromArgs(int argc, const char *const *argv) {
        Config config;

        for (int i = 1; i < argc; ++i) {
            std::string flag = argv[i];

            auto value = [&]() -> dp::Result<std::string, dp::Error> {
                if (i + 1 >= argc)
                    return dp::Result<std::string, dp::Error>::err(
                        invalid_input(dp::String(("Missing value for " + flag).c_str())));
                return dp::Result<std::string, dp::Error>::ok(std::string(argv[++i]));
            };

            if (flag == "--db") {
                auto path = value();
                if (!path.is_ok())
                    return dp::Result<Config, dp::Error>::err(path.error());
                config.db_path = path.value();
            } else if (flag == "--log") {
                auto path = value();
                if (!path.is_ok())
                    return dp::Result<Config, dp::Error>::err(path.error());
                config.log_path = path.value();
            } else if (flag == "--no-log") {
                config.log_path.clear();
            } else if (flag == "--log-level") {
                auto name = value();
                if (!name.is_ok())
                    return dp::Result<Config, dp::Error>::err(name.error());
                auto level = log::parseLevel(name.value());
                if (!level.is_ok())
                    return dp::Result<Config, dp::Error>::err(level.error());
                config.log_level = level.value();
            } else if (flag == "--no-wal") {
                config.store.enable_wal = false;
            } else {
                return dp::Result<Config, dp::Error>::err(
                    invalid_input(dp::String(("Unknown option: " + flag).c_str())));
            }
        }

        if (config.db_path.empty())
            return dp::Result<Config, dp::Error>::err(invalid_input("Database path is empty"));

        return dp::Result<Config, dp::Error>::ok(std::move(config));
    }

    std::string Config::usage(const std::string &program) {
        return "Usage: " + program +
               " [--db <path>] [--log <path> | --no-log] [--log-level debug|info|warn|error] [--no-wal]\n";
    }

} // namespace bankit
