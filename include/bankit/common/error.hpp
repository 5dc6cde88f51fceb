#pragma once

#include <datapod/datapod.hpp>

namespace bankit {

    // ===========================================
    // Bankit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_NOT_FOUND = 100;
    constexpr dp::u32 ERR_DESTINATION_NOT_FOUND = 101;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 102;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 103;
    constexpr dp::u32 ERR_INVALID_INPUT = 104;
    constexpr dp::u32 ERR_STORAGE_FAILURE = 105;
    constexpr dp::u32 ERR_NOT_OPEN = 106;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error not_found(const dp::String &msg = "Account not found") { return dp::Error{ERR_NOT_FOUND, msg}; }

    inline dp::Error destination_not_found(const dp::String &msg = "Client to transfer to not found") {
        return dp::Error{ERR_DESTINATION_NOT_FOUND, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be positive") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error invalid_input(const dp::String &msg = "Invalid input") {
        return dp::Error{ERR_INVALID_INPUT, msg};
    }

    inline dp::Error storage_failure(const dp::String &msg = "Storage failure") {
        return dp::Error{ERR_STORAGE_FAILURE, msg};
    }

    inline dp::Error not_open(const dp::String &msg = "Store not open") { return dp::Error{ERR_NOT_OPEN, msg}; }

    /// True for the outcomes a caller is expected to show to the user
    /// (everything except storage and lifecycle errors)
    inline bool is_domain_error(const dp::Error &error) {
        return error.code >= ERR_NOT_FOUND && error.code <= ERR_INVALID_INPUT;
    }

} // namespace bankit
