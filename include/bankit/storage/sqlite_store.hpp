#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <bankit/common/error.hpp>
#include <bankit/ledger/account.hpp>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace bankit::storage {

    using ledger::Account;
    using ledger::Movement;
    using ledger::MovementKind;

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::FULL;

        OpenOptions() = default;
    };

    // ===========================================
    // SqliteStore - accounts and movements
    // ===========================================

    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "bank.db"), ":memory:" for a private in-memory database
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        /// Create the ledger tables and run migrations. Idempotent.
        dp::Result<void, dp::Error> initializeSchema();

        // ===========================================
        // Scoped transactions (RAII)
        // ===========================================

        /// Savepoint-backed scope. The outermost guard commits to disk on
        /// commit(); inner guards fold into the enclosing one. Anything not
        /// committed is rolled back when the guard is destroyed.
        /// Guards must be released in LIFO order.
        class TxGuard {
          public:
            explicit TxGuard(SqliteStore &store);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// False if the savepoint could not be opened
            bool isActive() const { return active_; }

            dp::Result<void, dp::Error> commit();
            void rollback();

          private:
            SqliteStore &store_;
            bool active_;
        };

        std::unique_ptr<TxGuard> beginTransaction();

        // ===========================================
        // Accounts
        // ===========================================

        /// Insert an account with zero balance
        /// @return Assigned account identifier
        dp::Result<int64_t, dp::Error> createAccount(const std::string &name,
                                                     const std::optional<std::string> &occupation);

        /// Delete an account and all of its movements atomically
        /// @return ERR_NOT_FOUND if no such account
        dp::Result<void, dp::Error> deleteAccount(int64_t id);

        dp::Result<Account, dp::Error> getAccount(int64_t id);

        /// All accounts in insertion order
        dp::Result<std::vector<Account>, dp::Error> listAccounts();

        dp::Result<int64_t, dp::Error> countAccounts();

        /// Overwrite the stored balance. Callers pair this with appendMovement
        /// inside one TxGuard.
        dp::Result<void, dp::Error> updateBalance(int64_t id, Amount new_balance);

        // ===========================================
        // Movements
        // ===========================================

        /// Append a movement row
        /// @param amount Signed amount, negative for outflow
        /// @return Assigned movement identifier
        dp::Result<int64_t, dp::Error> appendMovement(int64_t account_id, MovementKind kind, Amount amount);

        /// Movements of one account in creation order
        dp::Result<std::vector<Movement>, dp::Error> listMovements(int64_t account_id);

        /// Sum of signed movement amounts of one account (0 if none)
        dp::Result<Amount, dp::Error> sumMovements(int64_t account_id);

        /// Total number of movement rows across all accounts
        dp::Result<int64_t, dp::Error> countMovements();

        // ===========================================
        // Maintenance
        // ===========================================

        /// Execute raw SQL (schema maintenance)
        dp::Result<void, dp::Error> executeSql(const std::string &sql);

        /// Run SQLite quick_check
        /// @return true if database is healthy
        dp::Result<bool, dp::Error> quickCheck();

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        void applyPragmas(const OpenOptions &opts);
        dp::Error lastError(const std::string &context) const;
        dp::Result<sqlite3_stmt *, dp::Error> prepare(const char *sql);
        dp::Result<int64_t, dp::Error> queryScalar(const char *sql, std::optional<int64_t> param);

        bool tableExists(const std::string &table_name);
        int32_t getCurrentSchemaVersion();
        dp::Result<void, dp::Error> setSchemaVersion(int32_t version);
        dp::Result<void, dp::Error> createSchemaV1();

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *ACCOUNTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                balance INTEGER NOT NULL CHECK(balance >= 0),
                occupation TEXT
            )
        )";

        static constexpr const char *MOVEMENTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS movements (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                account_id INTEGER NOT NULL,
                kind TEXT NOT NULL,
                amount INTEGER NOT NULL,
                FOREIGN KEY(account_id) REFERENCES accounts(id) ON DELETE CASCADE
            )
        )";

        static constexpr const char *IDX_MOVEMENTS_ACCOUNT =
            "CREATE INDEX IF NOT EXISTS idx_movements_account ON movements(account_id)";
    };

    /// Current Unix timestamp in seconds
    int64_t currentTimestamp();

} // namespace bankit::storage
