#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <bankit/common/money.hpp>

namespace bankit::ledger {

    enum class MovementKind { Withdraw, Deposit, TransferOut, TransferIn };

    /// Label persisted in movements.kind
    const char *toString(MovementKind kind);

    /// Inverse of toString, nullopt for an unknown label
    std::optional<MovementKind> movementKindFromString(const std::string &label);

    /// Snapshot of an account row. Not a live handle: re-read through the
    /// registry after any mutation.
    struct Account {
        int64_t id = 0;
        std::string name;
        Amount balance = 0;
        std::optional<std::string> occupation;

        Account() = default;
        Account(int64_t account_id, std::string account_name, Amount account_balance,
                std::optional<std::string> account_occupation = std::nullopt)
            : id(account_id), name(std::move(account_name)), balance(account_balance),
              occupation(std::move(account_occupation)) {}

        /// "(1, 'Alice', 70.00, 'Engineer')"
        std::string to_string() const;
    };

    /// Immutable signed ledger entry
    struct Movement {
        int64_t id = 0;
        int64_t account_id = 0;
        MovementKind kind = MovementKind::Deposit;
        Amount amount = 0;

        Movement() = default;
        Movement(int64_t movement_id, int64_t owner_id, MovementKind movement_kind, Amount signed_amount)
            : id(movement_id), account_id(owner_id), kind(movement_kind), amount(signed_amount) {}

        /// "Deposit: +100.00"
        std::string to_string() const;
    };

} // namespace bankit::ledger
