#pragma once

// High-level Bankit facade
// Owns the store handle and wires registry and engine onto it

#include <bankit/config.hpp>
#include <bankit/ledger/engine.hpp>
#include <bankit/ledger/registry.hpp>
#include <bankit/storage/sqlite_store.hpp>

namespace bankit {

    class Bank {
      public:
        Bank();
        ~Bank();

        // Registry and engine hold references into this object
        Bank(const Bank &) = delete;
        Bank &operator=(const Bank &) = delete;
        Bank(Bank &&) = delete;
        Bank &operator=(Bank &&) = delete;

        /// Configure logging, open the database and create the schema
        dp::Result<void, dp::Error> initialize(const Config &config);

        /// Close the database. Also run by the destructor.
        void shutdown();

        bool isOpen() const { return store_.isOpen(); }

        const Config &config() const { return config_; }

        ledger::AccountRegistry &registry() { return registry_; }
        ledger::TransactionEngine &engine() { return engine_; }
        storage::SqliteStore &store() { return store_; }

        /// Reconcile every account
        /// @return true if every balance equals the sum of its movements
        dp::Result<bool, dp::Error> verifyConsistency();

      private:
        Config config_;
        storage::SqliteStore store_;
        ledger::AccountRegistry registry_;
        ledger::TransactionEngine engine_;
    };

} // namespace bankit
