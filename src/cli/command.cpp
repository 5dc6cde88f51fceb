#include <bankit/cli/command.hpp>

#include <cctype>
#include <sstream>

namespace bankit::cli {

    namespace {

        dp::Result<int64_t, dp::Error> parsePositive(const std::string &text, const char *what) {
            size_t begin = 0;
            size_t end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
                ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                --end;

            // Only the ends are trimmed: "1 5" is a typo, not 15
            std::string digits;
            for (size_t i = begin; i < end; ++i) {
                char c = text[i];
                if (!std::isdigit(static_cast<unsigned char>(c)) || digits.size() >= 18)
                    return dp::Result<int64_t, dp::Error>::err(invalid_input(what));
                digits.push_back(c);
            }
            if (digits.empty())
                return dp::Result<int64_t, dp::Error>::err(invalid_input(what));

            int64_t value = std::stoll(digits);
            if (value <= 0)
                return dp::Result<int64_t, dp::Error>::err(invalid_input(what));
            return dp::Result<int64_t, dp::Error>::ok(value);
        }

        // std::visit target, one overload per command
        struct CommandRunner {
            Bank &bank;

            std::string operator()(const CreateAccount &cmd) const {
                std::optional<std::string> occupation;
                if (!cmd.occupation.empty())
                    occupation = cmd.occupation;

                auto created = bank.registry().open(cmd.name, occupation);
                if (!created.is_ok())
                    return describe(created.error());
                return "Created account for " + created.value().name + " with client ID " +
                       std::to_string(created.value().id) + ".";
            }

            std::string operator()(const CloseAccount &cmd) const {
                auto closed = bank.registry().close(cmd.client_id);
                if (!closed.is_ok())
                    return describe(closed.error());
                return "Closed account with client ID " + std::to_string(cmd.client_id) + ".";
            }

            std::string operator()(const ShowAllClients &) const {
                auto accounts = bank.registry().list();
                if (!accounts.is_ok())
                    return describe(accounts.error());
                if (accounts.value().empty())
                    return "No clients.";

                std::ostringstream oss;
                for (size_t i = 0; i < accounts.value().size(); ++i) {
                    if (i > 0)
                        oss << '\n';
                    oss << accounts.value()[i].to_string();
                }
                return oss.str();
            }

            std::string operator()(const CountClients &) const {
                auto total = bank.registry().count();
                if (!total.is_ok())
                    return describe(total.error());
                return "Total clients: " + std::to_string(total.value());
            }

            std::string operator()(const Withdraw &cmd) const {
                auto account = bank.registry().find(cmd.client_id);
                if (!account.is_ok())
                    return describe(account.error());
                auto updated = bank.engine().withdraw(account.value(), cmd.amount);
                if (!updated.is_ok())
                    return describe(updated.error());
                return "Withdrawn " + formatAmount(cmd.amount) + ". New balance: " +
                       formatAmount(updated.value().balance);
            }

            std::string operator()(const Deposit &cmd) const {
                auto account = bank.registry().find(cmd.client_id);
                if (!account.is_ok())
                    return describe(account.error());
                auto updated = bank.engine().deposit(account.value(), cmd.amount);
                if (!updated.is_ok())
                    return describe(updated.error());
                return "Deposited " + formatAmount(cmd.amount) + ". New balance: " +
                       formatAmount(updated.value().balance);
            }

            std::string operator()(const Transfer &cmd) const {
                auto account = bank.registry().find(cmd.client_id);
                if (!account.is_ok())
                    return describe(account.error());
                auto receipt = bank.engine().transfer(account.value(), cmd.destination_id, cmd.amount);
                if (!receipt.is_ok())
                    return describe(receipt.error());
                return "Transferred " + formatAmount(cmd.amount) + " to client ID " +
                       std::to_string(cmd.destination_id) + ". New balance: " +
                       formatAmount(receipt.value().source.balance);
            }

            std::string operator()(const CheckBalance &cmd) const {
                auto account = bank.registry().find(cmd.client_id);
                if (!account.is_ok())
                    return describe(account.error());
                auto balance = bank.engine().checkBalance(account.value());
                if (!balance.is_ok())
                    return describe(balance.error());
                return "Client ID " + std::to_string(cmd.client_id) + " balance: " + formatAmount(balance.value());
            }

            std::string operator()(const ShowMovements &cmd) const {
                auto account = bank.registry().find(cmd.client_id);
                if (!account.is_ok())
                    return describe(account.error());
                auto movements = bank.engine().showMovements(account.value());
                if (!movements.is_ok())
                    return describe(movements.error());

                std::ostringstream oss;
                oss << "Client ID " << cmd.client_id << " movements:";
                for (const auto &movement : movements.value())
                    oss << '\n' << movement.to_string();
                return oss.str();
            }
        };

    } // namespace

    dp::Result<BankAction, dp::Error> parseBankAction(const std::string &text) {
        auto choice = parsePositive(text, "Invalid action");
        if (!choice.is_ok() || choice.value() > static_cast<int64_t>(BankAction::Exit))
            return dp::Result<BankAction, dp::Error>::err(invalid_input("Invalid action"));
        return dp::Result<BankAction, dp::Error>::ok(static_cast<BankAction>(choice.value()));
    }

    dp::Result<ClientAction, dp::Error> parseClientAction(const std::string &text) {
        auto choice = parsePositive(text, "Invalid action");
        if (!choice.is_ok() || choice.value() > static_cast<int64_t>(ClientAction::Exit))
            return dp::Result<ClientAction, dp::Error>::err(invalid_input("Invalid action"));
        return dp::Result<ClientAction, dp::Error>::ok(static_cast<ClientAction>(choice.value()));
    }

    dp::Result<int64_t, dp::Error> parseClientId(const std::string &text) {
        return parsePositive(text, "Invalid client ID");
    }

    std::string bankMenu() {
        return "1. Create Account\n"
               "2. Close Account\n"
               "3. Show All Clients\n"
               "4. Count Clients\n"
               "5. Client Actions\n"
               "6. Exit\n";
    }

    std::string clientMenu() {
        return "1. Withdraw\n"
               "2. Deposit\n"
               "3. Transfer\n"
               "4. Check Balance\n"
               "5. Show Movements\n"
               "6. Exit\n";
    }

    std::string describe(const dp::Error &error) {
        switch (error.code) {
        case ERR_NOT_FOUND:
            return "Client not found.";
        case ERR_DESTINATION_NOT_FOUND:
            return "Client to transfer to not found.";
        case ERR_INSUFFICIENT_FUNDS:
            return "Insufficient funds.";
        case ERR_INVALID_AMOUNT:
            return std::string("Invalid amount: ") + error.message.c_str() + ".";
        case ERR_INVALID_INPUT:
            return std::string(error.message.c_str()) + ".";
        case ERR_STORAGE_FAILURE:
            return std::string("Storage error: ") + error.message.c_str();
        default:
            return std::string("Error: ") + error.message.c_str();
        }
    }

    std::string Dispatcher::run(const Command &command) { return std::visit(CommandRunner{bank_}, command); }

} // namespace bankit::cli
