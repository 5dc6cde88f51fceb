#pragma once

#include <vector>

#include <bankit/ledger/registry.hpp>
#include <bankit/storage/sqlite_store.hpp>

namespace bankit::ledger {

    /// Outcome of a committed transfer
    struct TransferReceipt {
        Account source;
        Account destination;
        Movement debit;
        Movement credit;
    };

    /// Deposit, withdrawal and transfer with movement logging.
    ///
    /// The engine keeps no state between calls. Each operation runs in its own
    /// scoped transaction and re-reads the account row inside it; the caller's
    /// snapshot only identifies the account. Any error means nothing was
    /// written: the scope rolls back before returning.
    /// The transfer destination is resolved through the registry on the same
    /// connection, so the lookup falls inside the open scope.
    class TransactionEngine {
      public:
        TransactionEngine(storage::SqliteStore &store, const AccountRegistry &registry)
            : store_(store), registry_(registry) {}

        /// Take amount out of the account
        /// @return Updated snapshot, or ERR_INVALID_AMOUNT / ERR_INSUFFICIENT_FUNDS / ERR_NOT_FOUND
        dp::Result<Account, dp::Error> withdraw(const Account &account, Amount amount);

        /// Put amount into the account
        /// @return Updated snapshot, or ERR_INVALID_AMOUNT / ERR_NOT_FOUND
        dp::Result<Account, dp::Error> deposit(const Account &account, Amount amount);

        /// Move amount from source to the account with destination_id.
        /// Debit, credit and both movements commit together or not at all.
        /// @return Receipt, or ERR_DESTINATION_NOT_FOUND / ERR_INVALID_INPUT (same account) /
        ///         ERR_INVALID_AMOUNT / ERR_INSUFFICIENT_FUNDS / ERR_NOT_FOUND (source)
        dp::Result<TransferReceipt, dp::Error> transfer(const Account &source, int64_t destination_id, Amount amount);

        dp::Result<Amount, dp::Error> checkBalance(const Account &account);

        dp::Result<std::vector<Movement>, dp::Error> showMovements(const Account &account);

        /// Compare the stored balance with the sum of the account's movements
        /// @return true when they agree
        dp::Result<bool, dp::Error> reconcile(int64_t account_id);

      private:
        storage::SqliteStore &store_;
        const AccountRegistry &registry_;

        /// Write new balance and its movement; caller owns the transaction
        dp::Result<Movement, dp::Error> post(int64_t account_id, Amount new_balance, MovementKind kind, Amount amount);
    };

} // namespace bankit::ledger
