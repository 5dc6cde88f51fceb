/**
 * Example: driving the ledger engine directly, without the menu front end
 *
 * This demo shows how to:
 * 1. Open a Bank on a scratch database
 * 2. Create accounts and move money between them
 * 3. Read balances and movement history back
 * 4. Check that every balance reconciles with its movements
 */

#include "bankit.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace bankit;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

void printMovements(ledger::TransactionEngine &engine, const ledger::Account &account) {
    auto movements = engine.showMovements(account);
    if (!movements.is_ok()) {
        std::cerr << "   Failed to read movements: " << movements.error().message.c_str() << std::endl;
        return;
    }
    std::cout << "   " << account.name << " movements:" << std::endl;
    for (const auto &movement : movements.value()) {
        std::cout << "     " << movement.to_string() << std::endl;
    }
}

int main() {
    const std::string db_path = "ledger_demo.db";
    std::filesystem::remove(db_path);

    Config config;
    config.db_path = db_path;
    config.log_path.clear();

    Bank bank;
    auto init = bank.initialize(config);
    if (!init.is_ok()) {
        std::cerr << "Failed to open ledger: " << init.error().message.c_str() << std::endl;
        return 1;
    }

    printSeparator("ACCOUNTS");

    auto alice = bank.registry().open("Alice", std::string("Engineer"));
    auto bob = bank.registry().open("Bob", std::nullopt);
    if (!alice.is_ok() || !bob.is_ok()) {
        std::cerr << "Failed to create accounts" << std::endl;
        return 1;
    }
    std::cout << "   " << alice.value().to_string() << std::endl;
    std::cout << "   " << bob.value().to_string() << std::endl;

    printSeparator("DEPOSIT AND WITHDRAW");

    auto &engine = bank.engine();
    auto deposited = engine.deposit(alice.value(), 100 * kMinorPerUnit);
    if (deposited.is_ok())
        std::cout << "   Deposit 100.00 -> balance " << formatAmount(deposited.value().balance) << std::endl;

    auto withdrawn = engine.withdraw(alice.value(), 30 * kMinorPerUnit);
    if (withdrawn.is_ok())
        std::cout << "   Withdraw 30.00 -> balance " << formatAmount(withdrawn.value().balance) << std::endl;

    auto refused = engine.withdraw(alice.value(), 1000 * kMinorPerUnit);
    std::cout << "   Withdraw 1000.00 -> " << (refused.is_ok() ? "accepted?!" : refused.error().message.c_str())
              << std::endl;

    printSeparator("TRANSFER");

    auto receipt = engine.transfer(alice.value(), bob.value().id, 20 * kMinorPerUnit);
    if (receipt.is_ok()) {
        std::cout << "   Alice " << formatAmount(receipt.value().source.balance) << ", Bob "
                  << formatAmount(receipt.value().destination.balance) << std::endl;
    }

    auto missing = engine.transfer(alice.value(), 9999, 5 * kMinorPerUnit);
    std::cout << "   Transfer to 9999 -> " << (missing.is_ok() ? "accepted?!" : missing.error().message.c_str())
              << std::endl;

    printSeparator("HISTORY");

    printMovements(engine, alice.value());
    printMovements(engine, bob.value());

    auto consistent = bank.verifyConsistency();
    std::cout << "\n   Ledger consistent: " << (consistent.is_ok() && consistent.value() ? "YES" : "NO") << std::endl;

    bank.shutdown();
    std::filesystem::remove(db_path);
    return 0;
}
