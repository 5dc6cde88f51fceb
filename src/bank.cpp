#include <bankit/bank.hpp>
#include <bankit/common/log.hpp>

namespace bankit {

    Bank::Bank() : registry_(store_), engine_(store_, registry_) {}

    Bank::~Bank() { shutdown(); }

    dp::Result<void, dp::Error> Bank::initialize(const Config &config) {
        config_ = config;

        auto logging = log::configure(config_.log_path, config_.log_level);
        if (!logging.is_ok())
            return logging;

        auto opened = store_.open(config_.db_path, config_.store);
        if (!opened.is_ok()) {
            log::error(std::string("Opening database failed: ") + opened.error().message.c_str());
            return opened;
        }

        auto schema = store_.initializeSchema();
        if (!schema.is_ok()) {
            log::error(std::string("Initializing schema failed: ") + schema.error().message.c_str());
            store_.close();
            return schema;
        }

        log::debug("Opened ledger at " + config_.db_path);
        return dp::Result<void, dp::Error>::ok();
    }

    void Bank::shutdown() {
        if (store_.isOpen()) {
            store_.close();
            log::debug("Closed ledger at " + config_.db_path);
        }
    }

    dp::Result<bool, dp::Error> Bank::verifyConsistency() {
        auto accounts = store_.listAccounts();
        if (!accounts.is_ok())
            return dp::Result<bool, dp::Error>::err(accounts.error());

        bool consistent = true;
        for (const auto &account : accounts.value()) {
            auto balanced = engine_.reconcile(account.id);
            if (!balanced.is_ok())
                return balanced;
            consistent = consistent && balanced.value();
        }
        return dp::Result<bool, dp::Error>::ok(consistent);
    }

} // namespace bankit
