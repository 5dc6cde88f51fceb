#pragma once

#include <optional>
#include <string>
#include <vector>

#include <bankit/storage/sqlite_store.hpp>

namespace bankit::ledger {

    /// Account creation, closure and lookup on top of the store.
    /// Every value returned is a snapshot of the persisted row.
    class AccountRegistry {
      private:
        storage::SqliteStore &store_;

      public:
        explicit AccountRegistry(storage::SqliteStore &store) : store_(store) {}

        /// Create an account with zero balance
        /// @param name Display name, must not be blank
        /// @param occupation Optional label, blank is stored as absent
        dp::Result<Account, dp::Error> open(const std::string &name, const std::optional<std::string> &occupation);

        /// Close an account, removing it and all its movements
        dp::Result<void, dp::Error> close(int64_t id);

        dp::Result<Account, dp::Error> find(int64_t id) const;

        dp::Result<bool, dp::Error> exists(int64_t id) const;

        dp::Result<std::vector<Account>, dp::Error> list() const;

        dp::Result<int64_t, dp::Error> count() const;
    };

} // namespace bankit::ledger
