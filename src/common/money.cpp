#include <bankit/common/money.hpp>

#include <cctype>
#include <sstream>

namespace bankit {

    std::string formatAmount(Amount amount) {
        bool negative = amount < 0;
        // Work on the unsigned magnitude so INT64_MIN does not overflow
        uint64_t magnitude = negative ? static_cast<uint64_t>(-(amount + 1)) + 1 : static_cast<uint64_t>(amount);

        std::ostringstream oss;
        if (negative)
            oss << '-';
        uint64_t fraction = magnitude % kMinorPerUnit;
        oss << magnitude / kMinorPerUnit << '.' << (fraction < 10 ? "0" : "") << fraction;
        return oss.str();
    }

    std::string formatSigned(Amount amount) { return amount < 0 ? formatAmount(amount) : "+" + formatAmount(amount); }

    dp::Result<void, dp::Error> validateAmount(Amount amount) {
        if (amount <= 0)
            return dp::Result<void, dp::Error>::err(invalid_amount());
        if (amount > kMaxAmount)
            return dp::Result<void, dp::Error>::err(invalid_amount("Amount exceeds the maximum allowed"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Amount, dp::Error> parseAmount(const std::string &text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
            --end;

        if (begin == end)
            return dp::Result<Amount, dp::Error>::err(invalid_amount("Amount is empty"));
        if (text[begin] == '-')
            return dp::Result<Amount, dp::Error>::err(invalid_amount());

        Amount units = 0;
        Amount fraction = 0;
        int32_t fraction_digits = 0;
        bool seen_point = false;
        bool seen_digit = false;

        for (size_t i = begin; i < end; ++i) {
            char c = text[i];
            if (c == '.') {
                if (seen_point)
                    return dp::Result<Amount, dp::Error>::err(invalid_amount("Amount is not a number"));
                seen_point = true;
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return dp::Result<Amount, dp::Error>::err(invalid_amount("Amount is not a number"));

            seen_digit = true;
            int32_t digit = c - '0';
            if (seen_point) {
                if (++fraction_digits > kMinorDigits)
                    return dp::Result<Amount, dp::Error>::err(
                        invalid_amount("Amount has more than two decimal places"));
                fraction = fraction * 10 + digit;
            } else {
                units = units * 10 + digit;
                if (units > kMaxAmount / kMinorPerUnit)
                    return dp::Result<Amount, dp::Error>::err(invalid_amount("Amount exceeds the maximum allowed"));
            }
        }

        if (!seen_digit)
            return dp::Result<Amount, dp::Error>::err(invalid_amount("Amount is not a number"));

        for (int32_t i = fraction_digits; i < kMinorDigits; ++i)
            fraction *= 10;

        Amount total = units * kMinorPerUnit + fraction;
        auto valid = validateAmount(total);
        if (!valid.is_ok())
            return dp::Result<Amount, dp::Error>::err(valid.error());
        return dp::Result<Amount, dp::Error>::ok(total);
    }

} // namespace bankit
