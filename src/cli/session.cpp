#include <bankit/cli/session.hpp>

namespace bankit::cli {

    std::optional<std::string> Session::ask(const std::string &prompt) {
        out_ << prompt << std::flush;
        std::string line;
        if (!std::getline(in_, line))
            return std::nullopt;
        return line;
    }

    void Session::reply(const Command &command) { out_ << dispatcher_.run(command) << std::endl; }

    void Session::run() {
        while (true) {
            out_ << bankMenu();
            auto choice = ask("Select an option: ");
            if (!choice)
                return;

            auto action = parseBankAction(*choice);
            if (!action.is_ok()) {
                out_ << "Invalid action." << std::endl;
                continue;
            }

            switch (action.value()) {
            case BankAction::CreateAccount: {
                auto name = ask("Enter first name: ");
                if (!name)
                    return;
                auto occupation = ask("Enter occupation (optional): ");
                if (!occupation)
                    return;
                reply(CreateAccount{*name, *occupation});
                break;
            }
            case BankAction::CloseAccount: {
                auto text = ask("Enter client ID: ");
                if (!text)
                    return;
                auto id = parseClientId(*text);
                if (!id.is_ok()) {
                    out_ << describe(id.error()) << std::endl;
                    break;
                }
                reply(CloseAccount{id.value()});
                break;
            }
            case BankAction::ShowAllClients:
                reply(ShowAllClients{});
                break;
            case BankAction::CountClients:
                reply(CountClients{});
                break;
            case BankAction::ClientActions: {
                auto text = ask("Enter client ID: ");
                if (!text)
                    return;
                auto id = parseClientId(*text);
                if (!id.is_ok()) {
                    out_ << describe(id.error()) << std::endl;
                    break;
                }
                auto client = bank_.registry().find(id.value());
                if (!client.is_ok()) {
                    out_ << describe(client.error()) << std::endl;
                    break;
                }
                if (!clientLoop(id.value()))
                    return;
                break;
            }
            case BankAction::Exit:
                return;
            }
        }
    }

    bool Session::clientLoop(int64_t client_id) {
        while (true) {
            out_ << clientMenu();
            auto choice = ask("Select an action: ");
            if (!choice)
                return false;

            auto action = parseClientAction(*choice);
            if (!action.is_ok()) {
                out_ << "Invalid action." << std::endl;
                continue;
            }

            switch (action.value()) {
            case ClientAction::Withdraw:
            case ClientAction::Deposit: {
                bool withdraw = action.value() == ClientAction::Withdraw;
                auto text = ask(withdraw ? "Enter amount to withdraw: " : "Enter amount to deposit: ");
                if (!text)
                    return false;
                auto amount = parseAmount(*text);
                if (!amount.is_ok()) {
                    out_ << describe(amount.error()) << std::endl;
                    break;
                }
                if (withdraw)
                    reply(Withdraw{client_id, amount.value()});
                else
                    reply(Deposit{client_id, amount.value()});
                break;
            }
            case ClientAction::Transfer: {
                auto target = ask("Enter client ID to transfer to: ");
                if (!target)
                    return false;
                auto destination = parseClientId(*target);
                if (!destination.is_ok()) {
                    out_ << describe(destination.error()) << std::endl;
                    break;
                }
                auto text = ask("Enter amount to transfer: ");
                if (!text)
                    return false;
                auto amount = parseAmount(*text);
                if (!amount.is_ok()) {
                    out_ << describe(amount.error()) << std::endl;
                    break;
                }
                reply(Transfer{client_id, destination.value(), amount.value()});
                break;
            }
            case ClientAction::CheckBalance:
                reply(CheckBalance{client_id});
                break;
            case ClientAction::ShowMovements:
                reply(ShowMovements{client_id});
                break;
            case ClientAction::Exit:
                return true;
            }
        }
    }

} // namespace bankit::cli
