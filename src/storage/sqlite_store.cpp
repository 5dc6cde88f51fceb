#include <bankit/storage/sqlite_store.hpp>

#include <chrono>
#include <sqlite3.h>

namespace bankit::storage {

    int64_t currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    namespace {

        Account readAccount(sqlite3_stmt *stmt) {
            Account account;
            account.id = sqlite3_column_int64(stmt, 0);
            account.name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
            account.balance = sqlite3_column_int64(stmt, 2);
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
                account.occupation = std::string(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 3)));
            }
            return account;
        }

    } // namespace

    // ===========================================
    // SqliteStore lifecycle
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        close();

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = "Cannot open database " + path;
            if (db_) {
                msg += ": " + std::string(sqlite3_errmsg(db_));
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_failure(dp::String(msg.c_str())));
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteStore::isOpen() const { return is_open_; }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        std::string msg = context;
        if (db_)
            msg += ": " + std::string(sqlite3_errmsg(db_));
        return storage_failure(dp::String(msg.c_str()));
    }

    dp::Result<sqlite3_stmt *, dp::Error> SqliteStore::prepare(const char *sql) {
        if (!db_ || !is_open_)
            return dp::Result<sqlite3_stmt *, dp::Error>::err(not_open());

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<sqlite3_stmt *, dp::Error>::err(lastError("prepare failed"));
        }
        return dp::Result<sqlite3_stmt *, dp::Error>::ok(stmt);
    }

    dp::Result<int64_t, dp::Error> SqliteStore::queryScalar(const char *sql, std::optional<int64_t> param) {
        auto prepared = prepare(sql);
        if (!prepared.is_ok())
            return dp::Result<int64_t, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        if (param)
            sqlite3_bind_int64(stmt, 1, *param);

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            auto error = lastError("query failed");
            sqlite3_finalize(stmt);
            return dp::Result<int64_t, dp::Error>::err(error);
        }

        int64_t value = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return dp::Result<int64_t, dp::Error>::ok(value);
    }

    // ===========================================
    // Schema
    // ===========================================

    dp::Result<void, dp::Error> SqliteStore::initializeSchema() {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_open());

        auto tx = beginTransaction();
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(lastError("cannot begin schema transaction"));

        auto migrations = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        int32_t current_version = getCurrentSchemaVersion();

        if (current_version < 1) {
            auto created = createSchemaV1();
            if (!created.is_ok())
                return created;
            auto versioned = setSchemaVersion(1);
            if (!versioned.is_ok())
                return versioned;
        }

        return tx->commit();
    }

    dp::Result<void, dp::Error> SqliteStore::createSchemaV1() {
        for (const char *sql : {ACCOUNTS_TABLE, MOVEMENTS_TABLE, IDX_MOVEMENTS_ACCOUNT}) {
            auto result = executeSql(sql);
            if (!result.is_ok())
                return result;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteStore::tableExists(const std::string &table_name) {
        auto prepared = prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
        if (!prepared.is_ok())
            return false;
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    int32_t SqliteStore::getCurrentSchemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        auto version = queryScalar("SELECT COALESCE(MAX(version), 0) FROM schema_migrations", std::nullopt);
        return version.is_ok() ? static_cast<int32_t>(version.value()) : 0;
    }

    dp::Result<void, dp::Error> SqliteStore::setSchemaVersion(int32_t version) {
        auto prepared = prepare("INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        if (!prepared.is_ok())
            return dp::Result<void, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = lastError("cannot record schema version");
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(error);
        }

        sqlite3_finalize(stmt);
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    // Every guard uses the same savepoint name: ROLLBACK TO / RELEASE always
    // address the most recent savepoint with that name, which is this guard
    // as long as guards nest strictly.
    SqliteStore::TxGuard::TxGuard(SqliteStore &store) : store_(store), active_(false) {
        if (store_.db_) {
            active_ = (sqlite3_exec(store_.db_, "SAVEPOINT bankit_tx", nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteStore::TxGuard::~TxGuard() { rollback(); }

    dp::Result<void, dp::Error> SqliteStore::TxGuard::commit() {
        if (!active_)
            return dp::Result<void, dp::Error>::err(storage_failure("Transaction is not active"));

        if (sqlite3_exec(store_.db_, "RELEASE SAVEPOINT bankit_tx", nullptr, nullptr, nullptr) != SQLITE_OK) {
            auto error = store_.lastError("commit failed");
            rollback();
            return dp::Result<void, dp::Error>::err(error);
        }

        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::TxGuard::rollback() {
        if (active_) {
            sqlite3_exec(store_.db_, "ROLLBACK TO SAVEPOINT bankit_tx", nullptr, nullptr, nullptr);
            sqlite3_exec(store_.db_, "RELEASE SAVEPOINT bankit_tx", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

    std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction() { return std::make_unique<TxGuard>(*this); }

    // ===========================================
    // Accounts
    // ===========================================

    dp::Result<int64_t, dp::Error> SqliteStore::createAccount(const std::string &name,
                                                              const std::optional<std::string> &occupation) {
        auto prepared = prepare("INSERT INTO accounts (name, balance, occupation) VALUES (?, 0, ?)");
        if (!prepared.is_ok())
            return dp::Result<int64_t, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        if (occupation) {
            sqlite3_bind_text(stmt, 2, occupation->c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, 2);
        }

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = lastError("cannot insert account");
            sqlite3_finalize(stmt);
            return dp::Result<int64_t, dp::Error>::err(error);
        }

        sqlite3_finalize(stmt);
        return dp::Result<int64_t, dp::Error>::ok(sqlite3_last_insert_rowid(db_));
    }

    dp::Result<void, dp::Error> SqliteStore::deleteAccount(int64_t id) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_open());

        auto tx = beginTransaction();
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(lastError("cannot begin transaction"));

        // Movements first so the delete does not depend on foreign_keys being on
        for (const char *sql : {"DELETE FROM movements WHERE account_id = ?", "DELETE FROM accounts WHERE id = ?"}) {
            auto prepared = prepare(sql);
            if (!prepared.is_ok())
                return dp::Result<void, dp::Error>::err(prepared.error());
            sqlite3_stmt *stmt = prepared.value();

            sqlite3_bind_int64(stmt, 1, id);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                auto error = lastError("cannot delete account");
                sqlite3_finalize(stmt);
                return dp::Result<void, dp::Error>::err(error);
            }
            sqlite3_finalize(stmt);
        }

        if (sqlite3_changes(db_) == 0)
            return dp::Result<void, dp::Error>::err(not_found());

        return tx->commit();
    }

    dp::Result<Account, dp::Error> SqliteStore::getAccount(int64_t id) {
        auto prepared = prepare("SELECT id, name, balance, occupation FROM accounts WHERE id = ?");
        if (!prepared.is_ok())
            return dp::Result<Account, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_int64(stmt, 1, id);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            Account account = readAccount(stmt);
            sqlite3_finalize(stmt);
            return dp::Result<Account, dp::Error>::ok(std::move(account));
        }

        auto error = (rc == SQLITE_DONE) ? not_found() : lastError("cannot read account");
        sqlite3_finalize(stmt);
        return dp::Result<Account, dp::Error>::err(error);
    }

    dp::Result<std::vector<Account>, dp::Error> SqliteStore::listAccounts() {
        auto prepared = prepare("SELECT id, name, balance, occupation FROM accounts ORDER BY id");
        if (!prepared.is_ok())
            return dp::Result<std::vector<Account>, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        std::vector<Account> accounts;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            accounts.push_back(readAccount(stmt));
        }

        if (rc != SQLITE_DONE) {
            auto error = lastError("cannot list accounts");
            sqlite3_finalize(stmt);
            return dp::Result<std::vector<Account>, dp::Error>::err(error);
        }

        sqlite3_finalize(stmt);
        return dp::Result<std::vector<Account>, dp::Error>::ok(std::move(accounts));
    }

    dp::Result<int64_t, dp::Error> SqliteStore::countAccounts() {
        return queryScalar("SELECT COUNT(*) FROM accounts", std::nullopt);
    }

    dp::Result<void, dp::Error> SqliteStore::updateBalance(int64_t id, Amount new_balance) {
        auto prepared = prepare("UPDATE accounts SET balance = ? WHERE id = ?");
        if (!prepared.is_ok())
            return dp::Result<void, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_int64(stmt, 1, new_balance);
        sqlite3_bind_int64(stmt, 2, id);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = lastError("cannot update balance");
            sqlite3_finalize(stmt);
            return dp::Result<void, dp::Error>::err(error);
        }
        sqlite3_finalize(stmt);

        if (sqlite3_changes(db_) == 0)
            return dp::Result<void, dp::Error>::err(not_found());
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Movements
    // ===========================================

    dp::Result<int64_t, dp::Error> SqliteStore::appendMovement(int64_t account_id, MovementKind kind, Amount amount) {
        auto prepared = prepare("INSERT INTO movements (account_id, kind, amount) VALUES (?, ?, ?)");
        if (!prepared.is_ok())
            return dp::Result<int64_t, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_int64(stmt, 1, account_id);
        sqlite3_bind_text(stmt, 2, ledger::toString(kind), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, amount);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto error = lastError("cannot append movement");
            sqlite3_finalize(stmt);
            return dp::Result<int64_t, dp::Error>::err(error);
        }

        sqlite3_finalize(stmt);
        return dp::Result<int64_t, dp::Error>::ok(sqlite3_last_insert_rowid(db_));
    }

    dp::Result<std::vector<Movement>, dp::Error> SqliteStore::listMovements(int64_t account_id) {
        auto prepared = prepare("SELECT id, account_id, kind, amount FROM movements WHERE account_id = ? ORDER BY id");
        if (!prepared.is_ok())
            return dp::Result<std::vector<Movement>, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        sqlite3_bind_int64(stmt, 1, account_id);

        std::vector<Movement> movements;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            std::string label = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
            auto kind = ledger::movementKindFromString(label);
            if (!kind) {
                sqlite3_finalize(stmt);
                return dp::Result<std::vector<Movement>, dp::Error>::err(
                    storage_failure(dp::String(("Unknown movement kind: " + label).c_str())));
            }
            movements.emplace_back(sqlite3_column_int64(stmt, 0), sqlite3_column_int64(stmt, 1), *kind,
                                   sqlite3_column_int64(stmt, 3));
        }

        if (rc != SQLITE_DONE) {
            auto error = lastError("cannot list movements");
            sqlite3_finalize(stmt);
            return dp::Result<std::vector<Movement>, dp::Error>::err(error);
        }

        sqlite3_finalize(stmt);
        return dp::Result<std::vector<Movement>, dp::Error>::ok(std::move(movements));
    }

    dp::Result<Amount, dp::Error> SqliteStore::sumMovements(int64_t account_id) {
        return queryScalar("SELECT COALESCE(SUM(amount), 0) FROM movements WHERE account_id = ?", account_id);
    }

    dp::Result<int64_t, dp::Error> SqliteStore::countMovements() {
        return queryScalar("SELECT COUNT(*) FROM movements", std::nullopt);
    }

    // ===========================================
    // Maintenance
    // ===========================================

    dp::Result<void, dp::Error> SqliteStore::executeSql(const std::string &sql) {
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_open());

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            std::string msg = "SQL error";
            if (errmsg) {
                msg += ": " + std::string(errmsg);
                sqlite3_free(errmsg);
            }
            return dp::Result<void, dp::Error>::err(storage_failure(dp::String(msg.c_str())));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<bool, dp::Error> SqliteStore::quickCheck() {
        auto prepared = prepare("PRAGMA quick_check");
        if (!prepared.is_ok())
            return dp::Result<bool, dp::Error>::err(prepared.error());
        sqlite3_stmt *stmt = prepared.value();

        bool ok = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            std::string result = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            ok = (result == "ok");
        }

        sqlite3_finalize(stmt);
        return dp::Result<bool, dp::Error>::ok(ok);
    }

} // namespace bankit::storage
