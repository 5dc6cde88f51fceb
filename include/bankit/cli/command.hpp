#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <bankit/bank.hpp>

namespace bankit::cli {

    enum class BankAction { CreateAccount = 1, CloseAccount, ShowAllClients, CountClients, ClientActions, Exit };

    enum class ClientAction { Withdraw = 1, Deposit, Transfer, CheckBalance, ShowMovements, Exit };

    // ===========================================
    // Commands - one struct per front-end request
    // ===========================================

    struct CreateAccount {
        std::string name;
        std::string occupation;
    };

    struct CloseAccount {
        int64_t client_id;
    };

    struct ShowAllClients {};

    struct CountClients {};

    struct Withdraw {
        int64_t client_id;
        Amount amount;
    };

    struct Deposit {
        int64_t client_id;
        Amount amount;
    };

    struct Transfer {
        int64_t client_id;
        int64_t destination_id;
        Amount amount;
    };

    struct CheckBalance {
        int64_t client_id;
    };

    struct ShowMovements {
        int64_t client_id;
    };

    using Command = std::variant<CreateAccount, CloseAccount, ShowAllClients, CountClients, Withdraw, Deposit, Transfer,
                                 CheckBalance, ShowMovements>;

    // ===========================================
    // Input parsing
    // ===========================================

    dp::Result<BankAction, dp::Error> parseBankAction(const std::string &text);
    dp::Result<ClientAction, dp::Error> parseClientAction(const std::string &text);

    /// Positive integer account identifier
    dp::Result<int64_t, dp::Error> parseClientId(const std::string &text);

    std::string bankMenu();
    std::string clientMenu();

    /// User-facing text for an error returned by the bank
    std::string describe(const dp::Error &error);

    // ===========================================
    // Dispatcher
    // ===========================================

    /// Executes commands against a Bank and renders the reply text
    class Dispatcher {
      public:
        explicit Dispatcher(Bank &bank) : bank_(bank) {}

        std::string run(const Command &command);

      private:
        Bank &bank_;
    };

} // namespace bankit::cli
