#pragma once

#include <cstdint>
#include <string>

#include "error.hpp"

namespace bankit {

    /// Amounts and balances are integer minor units (cents)
    using Amount = int64_t;

    constexpr int32_t kMinorDigits = 2;
    constexpr Amount kMinorPerUnit = 100;

    /// Upper bound for a single amount and for any balance (10 billion units)
    constexpr Amount kMaxAmount = 1'000'000'000'000;

    /// Format minor units as a decimal string, e.g. 12345 -> "123.45", -2000 -> "-20.00"
    std::string formatAmount(Amount amount);

    /// Format a signed movement amount with an explicit sign, e.g. "+100.00" or "-30.00"
    std::string formatSigned(Amount amount);

    /// Parse user-entered decimal text into minor units
    /// Accepts "12", "12.5", "12.34" (surrounding whitespace ignored)
    /// Rejects empty, signed, non-numeric (including nan/inf), more than two
    /// fractional digits, zero and anything above kMaxAmount
    dp::Result<Amount, dp::Error> parseAmount(const std::string &text);

    /// Check a pre-parsed amount: positive and not above kMaxAmount
    dp::Result<void, dp::Error> validateAmount(Amount amount);

} // namespace bankit
