#include <bankit/common/log.hpp>
#include <bankit/ledger/registry.hpp>

namespace bankit::ledger {

    namespace {

        std::string trim(const std::string &text) {
            const char *whitespace = " \t\r\n";
            auto begin = text.find_first_not_of(whitespace);
            if (begin == std::string::npos)
                return "";
            auto end = text.find_last_not_of(whitespace);
            return text.substr(begin, end - begin + 1);
        }

    } // namespace

    dp::Result<Account, dp::Error> AccountRegistry::open(const std::string &name,
                                                         const std::optional<std::string> &occupation) {
        std::string clean_name = trim(name);
        if (clean_name.empty()) {
            log::warn("Refused to create account with an empty name.");
            return dp::Result<Account, dp::Error>::err(invalid_input("Name is required"));
        }

        std::optional<std::string> clean_occupation;
        if (occupation) {
            std::string value = trim(*occupation);
            if (!value.empty())
                clean_occupation = value;
        }

        auto created = store_.createAccount(clean_name, clean_occupation);
        if (!created.is_ok()) {
            log::error("Creating account for " + clean_name + " failed: " + created.error().message.c_str());
            return dp::Result<Account, dp::Error>::err(created.error());
        }

        log::info("Created account for " + clean_name + " with occupation " + clean_occupation.value_or("None") +
                  ".");
        return dp::Result<Account, dp::Error>::ok(Account(created.value(), clean_name, 0, clean_occupation));
    }

    dp::Result<void, dp::Error> AccountRegistry::close(int64_t id) {
        auto deleted = store_.deleteAccount(id);
        if (!deleted.is_ok()) {
            if (deleted.error().code == ERR_NOT_FOUND)
                log::warn("Cannot close client ID " + std::to_string(id) + ": not found.");
            else
                log::error("Closing client ID " + std::to_string(id) + " failed: " + deleted.error().message.c_str());
            return deleted;
        }

        log::info("Closed account with client ID " + std::to_string(id) + ".");
        return deleted;
    }

    dp::Result<Account, dp::Error> AccountRegistry::find(int64_t id) const { return store_.getAccount(id); }

    dp::Result<bool, dp::Error> AccountRegistry::exists(int64_t id) const {
        auto account = store_.getAccount(id);
        if (account.is_ok())
            return dp::Result<bool, dp::Error>::ok(true);
        if (account.error().code == ERR_NOT_FOUND)
            return dp::Result<bool, dp::Error>::ok(false);
        return dp::Result<bool, dp::Error>::err(account.error());
    }

    dp::Result<std::vector<Account>, dp::Error> AccountRegistry::list() const {
        auto accounts = store_.listAccounts();
        if (accounts.is_ok())
            log::info("All clients: " + std::to_string(accounts.value().size()) + " listed.");
        return accounts;
    }

    dp::Result<int64_t, dp::Error> AccountRegistry::count() const {
        auto total = store_.countAccounts();
        if (total.is_ok())
            log::info("Total clients: " + std::to_string(total.value()));
        return total;
    }

} // namespace bankit::ledger
