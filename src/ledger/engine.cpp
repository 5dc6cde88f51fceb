#include <bankit/common/log.hpp>
#include <bankit/ledger/engine.hpp>

namespace bankit::ledger {

    namespace {

        std::string clientLabel(int64_t id) { return "client ID " + std::to_string(id); }

        // Domain rejections are warnings, anything else is a storage problem
        void report(const std::string &operation, const dp::Error &error) {
            std::string line = operation + ": " + error.message.c_str();
            if (is_domain_error(error))
                log::warn(line);
            else
                log::error(line);
        }

    } // namespace

    dp::Result<Movement, dp::Error> TransactionEngine::post(int64_t account_id, Amount new_balance, MovementKind kind,
                                                            Amount amount) {
        auto updated = store_.updateBalance(account_id, new_balance);
        if (!updated.is_ok())
            return dp::Result<Movement, dp::Error>::err(updated.error());

        auto appended = store_.appendMovement(account_id, kind, amount);
        if (!appended.is_ok())
            return dp::Result<Movement, dp::Error>::err(appended.error());

        return dp::Result<Movement, dp::Error>::ok(Movement(appended.value(), account_id, kind, amount));
    }

    dp::Result<Account, dp::Error> TransactionEngine::withdraw(const Account &account, Amount amount) {
        auto fail = [&](const dp::Error &error) {
            report("Withdraw from " + clientLabel(account.id), error);
            return dp::Result<Account, dp::Error>::err(error);
        };

        auto valid = validateAmount(amount);
        if (!valid.is_ok())
            return fail(valid.error());

        auto tx = store_.beginTransaction();
        if (!tx->isActive())
            return fail(storage_failure("Cannot begin transaction"));

        auto current = store_.getAccount(account.id);
        if (!current.is_ok())
            return fail(current.error());
        Account snapshot = current.value();

        if (amount > snapshot.balance)
            return fail(insufficient_funds());

        Amount new_balance = snapshot.balance - amount;
        auto posted = post(snapshot.id, new_balance, MovementKind::Withdraw, -amount);
        if (!posted.is_ok())
            return fail(posted.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return fail(committed.error());

        snapshot.balance = new_balance;
        log::info("Withdrawn " + formatAmount(amount) + " from " + clientLabel(snapshot.id) + ".");
        return dp::Result<Account, dp::Error>::ok(std::move(snapshot));
    }

    dp::Result<Account, dp::Error> TransactionEngine::deposit(const Account &account, Amount amount) {
        auto fail = [&](const dp::Error &error) {
            report("Deposit to " + clientLabel(account.id), error);
            return dp::Result<Account, dp::Error>::err(error);
        };

        auto valid = validateAmount(amount);
        if (!valid.is_ok())
            return fail(valid.error());

        auto tx = store_.beginTransaction();
        if (!tx->isActive())
            return fail(storage_failure("Cannot begin transaction"));

        auto current = store_.getAccount(account.id);
        if (!current.is_ok())
            return fail(current.error());
        Account snapshot = current.value();

        if (snapshot.balance > kMaxAmount - amount)
            return fail(invalid_amount("Balance would exceed the maximum allowed"));

        Amount new_balance = snapshot.balance + amount;
        auto posted = post(snapshot.id, new_balance, MovementKind::Deposit, amount);
        if (!posted.is_ok())
            return fail(posted.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return fail(committed.error());

        snapshot.balance = new_balance;
        log::info("Deposited " + formatAmount(amount) + " to " + clientLabel(snapshot.id) + ".");
        return dp::Result<Account, dp::Error>::ok(std::move(snapshot));
    }

    dp::Result<TransferReceipt, dp::Error> TransactionEngine::transfer(const Account &source, int64_t destination_id,
                                                                       Amount amount) {
        auto fail = [&](const dp::Error &error) {
            report("Transfer from " + clientLabel(source.id) + " to " + clientLabel(destination_id), error);
            return dp::Result<TransferReceipt, dp::Error>::err(error);
        };

        auto tx = store_.beginTransaction();
        if (!tx->isActive())
            return fail(storage_failure("Cannot begin transaction"));

        auto destination = registry_.find(destination_id);
        if (!destination.is_ok()) {
            if (destination.error().code == ERR_NOT_FOUND) {
                return fail(destination_not_found(
                    dp::String(("Client to transfer to (ID: " + std::to_string(destination_id) + ") not found").c_str())));
            }
            return fail(destination.error());
        }

        if (destination_id == source.id)
            return fail(invalid_input("Cannot transfer to the same account"));

        auto valid = validateAmount(amount);
        if (!valid.is_ok())
            return fail(valid.error());

        auto current = store_.getAccount(source.id);
        if (!current.is_ok())
            return fail(current.error());

        TransferReceipt receipt;
        receipt.source = current.value();
        receipt.destination = destination.value();

        if (amount > receipt.source.balance)
            return fail(insufficient_funds());
        if (receipt.destination.balance > kMaxAmount - amount)
            return fail(invalid_amount("Destination balance would exceed the maximum allowed"));

        Amount source_balance = receipt.source.balance - amount;
        Amount destination_balance = receipt.destination.balance + amount;

        auto debit = post(receipt.source.id, source_balance, MovementKind::TransferOut, -amount);
        if (!debit.is_ok())
            return fail(debit.error());

        auto credit = post(receipt.destination.id, destination_balance, MovementKind::TransferIn, amount);
        if (!credit.is_ok())
            return fail(credit.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return fail(committed.error());

        receipt.source.balance = source_balance;
        receipt.destination.balance = destination_balance;
        receipt.debit = debit.value();
        receipt.credit = credit.value();

        log::info("Transferred " + formatAmount(amount) + " from " + clientLabel(source.id) + " to " +
                  clientLabel(destination_id) + ".");
        return dp::Result<TransferReceipt, dp::Error>::ok(std::move(receipt));
    }

    dp::Result<Amount, dp::Error> TransactionEngine::checkBalance(const Account &account) {
        auto current = store_.getAccount(account.id);
        if (!current.is_ok()) {
            report("Balance of " + clientLabel(account.id), current.error());
            return dp::Result<Amount, dp::Error>::err(current.error());
        }

        Amount balance = current.value().balance;
        log::info("Client ID " + std::to_string(account.id) + " balance: " + formatAmount(balance));
        return dp::Result<Amount, dp::Error>::ok(balance);
    }

    dp::Result<std::vector<Movement>, dp::Error> TransactionEngine::showMovements(const Account &account) {
        auto current = store_.getAccount(account.id);
        if (!current.is_ok()) {
            report("Movements of " + clientLabel(account.id), current.error());
            return dp::Result<std::vector<Movement>, dp::Error>::err(current.error());
        }

        auto movements = store_.listMovements(account.id);
        if (!movements.is_ok()) {
            report("Movements of " + clientLabel(account.id), movements.error());
            return movements;
        }

        log::info("Client ID " + std::to_string(account.id) + " movements: " +
                  std::to_string(movements.value().size()) + " entries.");
        return movements;
    }

    dp::Result<bool, dp::Error> TransactionEngine::reconcile(int64_t account_id) {
        auto account = store_.getAccount(account_id);
        if (!account.is_ok())
            return dp::Result<bool, dp::Error>::err(account.error());

        auto total = store_.sumMovements(account_id);
        if (!total.is_ok())
            return dp::Result<bool, dp::Error>::err(total.error());

        bool balanced = account.value().balance == total.value();
        if (!balanced) {
            log::error("Client ID " + std::to_string(account_id) + " balance " +
                       formatAmount(account.value().balance) + " does not match movements " +
                       formatAmount(total.value()));
        }
        return dp::Result<bool, dp::Error>::ok(balanced);
    }

} // namespace bankit::ledger
