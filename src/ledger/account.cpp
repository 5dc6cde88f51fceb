#include <bankit/ledger/account.hpp>

#include <sstream>

namespace bankit::ledger {

    const char *toString(MovementKind kind) {
        switch (kind) {
        case MovementKind::Withdraw:
            return "Withdraw";
        case MovementKind::Deposit:
            return "Deposit";
        case MovementKind::TransferOut:
            return "Transfer Out";
        case MovementKind::TransferIn:
            return "Transfer In";
        }
        return "Deposit";
    }

    std::optional<MovementKind> movementKindFromString(const std::string &label) {
        if (label == "Withdraw")
            return MovementKind::Withdraw;
        if (label == "Deposit")
            return MovementKind::Deposit;
        if (label == "Transfer Out")
            return MovementKind::TransferOut;
        if (label == "Transfer In")
            return MovementKind::TransferIn;
        return std::nullopt;
    }

    std::string Account::to_string() const {
        std::ostringstream oss;
        oss << '(' << id << ", '" << name << "', " << formatAmount(balance) << ", ";
        if (occupation)
            oss << '\'' << *occupation << '\'';
        else
            oss << "None";
        oss << ')';
        return oss.str();
    }

    std::string Movement::to_string() const { return std::string(toString(kind)) + ": " + formatSigned(amount); }

} // namespace bankit::ledger
