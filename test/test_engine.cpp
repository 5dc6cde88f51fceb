#include <doctest/doctest.h>

#include <bankit/ledger/engine.hpp>
#include <bankit/ledger/registry.hpp>
#include <test_db.hpp>

using namespace bankit;
using namespace bankit::ledger;

namespace {

    struct LedgerFixture {
        TestDB db;
        AccountRegistry registry;
        TransactionEngine engine;

        explicit LedgerFixture(const std::string &name)
            : db(name), registry(db.store), engine(db.store, registry) {
            REQUIRE(db.store.open(db.path).is_ok());
            REQUIRE(db.store.initializeSchema().is_ok());
        }

        Account open(const std::string &name, Amount initial = 0) {
            auto account = registry.open(name, std::nullopt);
            REQUIRE(account.is_ok());
            if (initial > 0) {
                auto funded = engine.deposit(account.value(), initial);
                REQUIRE(funded.is_ok());
                return funded.value();
            }
            return account.value();
        }

        Amount balanceOf(int64_t id) { return registry.find(id).value().balance; }

        bool reconciled(int64_t id) {
            auto result = engine.reconcile(id);
            return result.is_ok() && result.value();
        }
    };

} // namespace

TEST_SUITE("TransactionEngine") {

    TEST_CASE("Deposit") {
        LedgerFixture fx("test_engine_deposit");
        auto alice = fx.open("Alice");

        SUBCASE("Balance and history grow together") {
            auto deposited = fx.engine.deposit(alice, 10000);
            REQUIRE(deposited.is_ok());
            CHECK(deposited.value().balance == 10000);
            CHECK(fx.balanceOf(alice.id) == 10000);

            auto movements = fx.engine.showMovements(alice);
            REQUIRE(movements.is_ok());
            REQUIRE(movements.value().size() == 1);
            CHECK(movements.value()[0].kind == MovementKind::Deposit);
            CHECK(movements.value()[0].amount == 10000);
            CHECK(movements.value()[0].to_string() == "Deposit: +100.00");
            CHECK(fx.reconciled(alice.id));
        }

        SUBCASE("Non-positive amounts are refused") {
            for (Amount amount : {Amount(0), Amount(-1), Amount(-10000)}) {
                auto deposited = fx.engine.deposit(alice, amount);
                REQUIRE(deposited.is_err());
                CHECK(deposited.error().code == ERR_INVALID_AMOUNT);
            }
            CHECK(fx.balanceOf(alice.id) == 0);
            CHECK(fx.engine.showMovements(alice).value().empty());
        }

        SUBCASE("Balance may not exceed the maximum") {
            REQUIRE(fx.engine.deposit(alice, kMaxAmount).is_ok());

            auto over = fx.engine.deposit(alice, 1);
            REQUIRE(over.is_err());
            CHECK(over.error().code == ERR_INVALID_AMOUNT);
            CHECK(fx.balanceOf(alice.id) == kMaxAmount);
            CHECK(fx.engine.showMovements(alice).value().size() == 1);
        }

        SUBCASE("Stale snapshot only identifies the account") {
            Account stale = alice;
            REQUIRE(fx.engine.deposit(alice, 5000).is_ok());

            auto second = fx.engine.deposit(stale, 2500);
            REQUIRE(second.is_ok());
            CHECK(second.value().balance == 7500);
            CHECK(fx.reconciled(alice.id));
        }

        SUBCASE("Failed movement insert rolls back the balance") {
            REQUIRE(fx.engine.deposit(alice, 4000).is_ok());
            REQUIRE(fx.db.store
                        .executeSql("CREATE TRIGGER fail_deposit BEFORE INSERT ON movements "
                                    "WHEN NEW.kind = 'Deposit' "
                                    "BEGIN SELECT RAISE(ABORT, 'injected failure'); END;")
                        .is_ok());

            auto deposited = fx.engine.deposit(alice, 1000);
            REQUIRE(deposited.is_err());
            CHECK(deposited.error().code == ERR_STORAGE_FAILURE);
            CHECK(fx.balanceOf(alice.id) == 4000);
            CHECK(fx.db.store.countMovements().value() == 1);
            CHECK(fx.reconciled(alice.id));
        }

        SUBCASE("Closed account") {
            REQUIRE(fx.registry.close(alice.id).is_ok());

            auto deposited = fx.engine.deposit(alice, 100);
            REQUIRE(deposited.is_err());
            CHECK(deposited.error().code == ERR_NOT_FOUND);
            CHECK(fx.db.store.countMovements().value() == 0);
        }
    }

    TEST_CASE("Withdraw") {
        LedgerFixture fx("test_engine_withdraw");
        auto alice = fx.open("Alice", 10000);

        SUBCASE("Deposit 100 then withdraw 30") {
            auto withdrawn = fx.engine.withdraw(alice, 3000);
            REQUIRE(withdrawn.is_ok());
            CHECK(withdrawn.value().balance == 7000);

            auto movements = fx.engine.showMovements(alice).value();
            REQUIRE(movements.size() == 2);
            CHECK(movements[1].kind == MovementKind::Withdraw);
            CHECK(movements[1].amount == -3000);
            CHECK(movements[1].to_string() == "Withdraw: -30.00");
            CHECK(fx.reconciled(alice.id));

            auto refused = fx.engine.withdraw(alice, 100000);
            REQUIRE(refused.is_err());
            CHECK(refused.error().code == ERR_INSUFFICIENT_FUNDS);
            CHECK(fx.balanceOf(alice.id) == 7000);
            CHECK(fx.engine.showMovements(alice).value().size() == 2);
        }

        SUBCASE("Whole balance can be withdrawn") {
            auto withdrawn = fx.engine.withdraw(alice, 10000);
            REQUIRE(withdrawn.is_ok());
            CHECK(withdrawn.value().balance == 0);
            CHECK(fx.reconciled(alice.id));
        }

        SUBCASE("Insufficient funds leaves no trace") {
            auto withdrawn = fx.engine.withdraw(alice, 10001);
            REQUIRE(withdrawn.is_err());
            CHECK(withdrawn.error().code == ERR_INSUFFICIENT_FUNDS);
            CHECK(fx.balanceOf(alice.id) == 10000);
            CHECK(fx.engine.showMovements(alice).value().size() == 1);
        }

        SUBCASE("Empty account refuses any withdrawal") {
            auto bob = fx.open("Bob");
            auto withdrawn = fx.engine.withdraw(bob, 1);
            REQUIRE(withdrawn.is_err());
            CHECK(withdrawn.error().code == ERR_INSUFFICIENT_FUNDS);
        }

        SUBCASE("Failed movement insert rolls back the balance") {
            REQUIRE(fx.db.store
                        .executeSql("CREATE TRIGGER fail_withdraw BEFORE INSERT ON movements "
                                    "WHEN NEW.kind = 'Withdraw' "
                                    "BEGIN SELECT RAISE(ABORT, 'injected failure'); END;")
                        .is_ok());

            auto withdrawn = fx.engine.withdraw(alice, 3000);
            REQUIRE(withdrawn.is_err());
            CHECK(withdrawn.error().code == ERR_STORAGE_FAILURE);
            CHECK(fx.balanceOf(alice.id) == 10000);
            CHECK(fx.db.store.countMovements().value() == 1);
            CHECK(fx.reconciled(alice.id));
        }

        SUBCASE("Invalid amount") {
            auto withdrawn = fx.engine.withdraw(alice, 0);
            REQUIRE(withdrawn.is_err());
            CHECK(withdrawn.error().code == ERR_INVALID_AMOUNT);
            CHECK(fx.balanceOf(alice.id) == 10000);
        }
    }

    TEST_CASE("Transfer") {
        LedgerFixture fx("test_engine_transfer");
        auto alice = fx.open("Alice", 5000);
        auto bob = fx.open("Bob");

        SUBCASE("Transfer 20 from Alice to Bob") {
            auto receipt = fx.engine.transfer(alice, bob.id, 2000);
            REQUIRE(receipt.is_ok());
            CHECK(receipt.value().source.balance == 3000);
            CHECK(receipt.value().destination.balance == 2000);
            CHECK(receipt.value().debit.kind == MovementKind::TransferOut);
            CHECK(receipt.value().debit.amount == -2000);
            CHECK(receipt.value().credit.kind == MovementKind::TransferIn);
            CHECK(receipt.value().credit.amount == 2000);
            CHECK(receipt.value().debit.id < receipt.value().credit.id);

            CHECK(fx.balanceOf(alice.id) == 3000);
            CHECK(fx.balanceOf(bob.id) == 2000);

            auto bob_history = fx.engine.showMovements(bob).value();
            REQUIRE(bob_history.size() == 1);
            CHECK(bob_history[0].to_string() == "Transfer In: +20.00");

            CHECK(fx.reconciled(alice.id));
            CHECK(fx.reconciled(bob.id));
        }

        SUBCASE("Total money is conserved") {
            REQUIRE(fx.engine.transfer(alice, bob.id, 1234).is_ok());
            REQUIRE(fx.engine.transfer(bob, alice.id, 234).is_ok());
            REQUIRE(fx.engine.transfer(alice, bob.id, 4000).is_ok());
            CHECK(fx.balanceOf(alice.id) + fx.balanceOf(bob.id) == 5000);
            CHECK(fx.reconciled(alice.id));
            CHECK(fx.reconciled(bob.id));
        }

        SUBCASE("Unknown destination") {
            auto receipt = fx.engine.transfer(alice, 9999, 1000);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_DESTINATION_NOT_FOUND);
            CHECK(std::string(receipt.error().message.c_str()).find("9999") != std::string::npos);
            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.db.store.countMovements().value() == 1);
        }

        SUBCASE("Closed destination") {
            REQUIRE(fx.registry.close(bob.id).is_ok());

            auto receipt = fx.engine.transfer(alice, bob.id, 1000);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_DESTINATION_NOT_FOUND);
            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.engine.showMovements(alice).value().size() == 1);
        }

        SUBCASE("Destination is checked before the amount") {
            auto receipt = fx.engine.transfer(alice, 9999, -5);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_DESTINATION_NOT_FOUND);
        }

        SUBCASE("Same account is refused") {
            auto receipt = fx.engine.transfer(alice, alice.id, 1000);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_INVALID_INPUT);
            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.engine.showMovements(alice).value().size() == 1);
        }

        SUBCASE("Insufficient funds moves nothing") {
            auto receipt = fx.engine.transfer(alice, bob.id, 5001);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_INSUFFICIENT_FUNDS);
            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.balanceOf(bob.id) == 0);
            CHECK(fx.db.store.countMovements().value() == 1);
        }

        SUBCASE("Invalid amount") {
            auto receipt = fx.engine.transfer(alice, bob.id, 0);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_INVALID_AMOUNT);
        }

        SUBCASE("Destination balance may not exceed the maximum") {
            REQUIRE(fx.engine.deposit(bob, kMaxAmount).is_ok());

            auto receipt = fx.engine.transfer(alice, bob.id, 1);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_INVALID_AMOUNT);
            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.balanceOf(bob.id) == kMaxAmount);
        }

        SUBCASE("Failed credit rolls back the debit") {
            REQUIRE(fx.db.store
                        .executeSql("CREATE TRIGGER fail_credit BEFORE INSERT ON movements "
                                    "WHEN NEW.kind = 'Transfer In' "
                                    "BEGIN SELECT RAISE(ABORT, 'injected failure'); END;")
                        .is_ok());

            auto receipt = fx.engine.transfer(alice, bob.id, 2000);
            REQUIRE(receipt.is_err());
            CHECK(receipt.error().code == ERR_STORAGE_FAILURE);

            CHECK(fx.balanceOf(alice.id) == 5000);
            CHECK(fx.balanceOf(bob.id) == 0);
            CHECK(fx.engine.showMovements(alice).value().size() == 1);
            CHECK(fx.engine.showMovements(bob).value().empty());
            CHECK(fx.reconciled(alice.id));
            CHECK(fx.reconciled(bob.id));

            REQUIRE(fx.db.store.executeSql("DROP TRIGGER fail_credit").is_ok());
            CHECK(fx.engine.transfer(alice, bob.id, 2000).is_ok());
            CHECK(fx.balanceOf(bob.id) == 2000);
        }
    }

    TEST_CASE("Reads") {
        LedgerFixture fx("test_engine_reads");
        auto alice = fx.open("Alice", 10000);
        REQUIRE(fx.engine.withdraw(alice, 3000).is_ok());

        SUBCASE("Balance reads the stored value") {
            auto balance = fx.engine.checkBalance(alice);
            REQUIRE(balance.is_ok());
            CHECK(balance.value() == 7000);
        }

        SUBCASE("Repeated reads change nothing") {
            auto first = fx.engine.showMovements(alice);
            auto second = fx.engine.showMovements(alice);
            REQUIRE(first.is_ok());
            REQUIRE(second.is_ok());
            REQUIRE(first.value().size() == second.value().size());
            for (size_t i = 0; i < first.value().size(); ++i) {
                CHECK(first.value()[i].id == second.value()[i].id);
                CHECK(first.value()[i].amount == second.value()[i].amount);
            }
            CHECK(fx.engine.checkBalance(alice).value() == fx.engine.checkBalance(alice).value());
            CHECK(fx.db.store.countMovements().value() == 2);
        }

        SUBCASE("Closed account cannot be read") {
            REQUIRE(fx.registry.close(alice.id).is_ok());
            CHECK(fx.engine.checkBalance(alice).error().code == ERR_NOT_FOUND);
            CHECK(fx.engine.showMovements(alice).error().code == ERR_NOT_FOUND);
        }
    }

    TEST_CASE("Reconciliation") {
        LedgerFixture fx("test_engine_reconcile");
        auto alice = fx.open("Alice", 10000);

        SUBCASE("Fresh account reconciles") {
            auto bob = fx.open("Bob");
            CHECK(fx.reconciled(bob.id));
        }

        SUBCASE("Balance edited behind the ledger is detected") {
            REQUIRE(fx.db.store.updateBalance(alice.id, 9999).is_ok());
            auto result = fx.engine.reconcile(alice.id);
            REQUIRE(result.is_ok());
            CHECK_FALSE(result.value());
        }

        SUBCASE("Unknown account") {
            auto result = fx.engine.reconcile(4242);
            REQUIRE(result.is_err());
            CHECK(result.error().code == ERR_NOT_FOUND);
        }
    }
}
