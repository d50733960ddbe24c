// ZSwap - Transfer, Authorization and Event Log Tests

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace zswap;
using namespace zswap::testing;

TEST_CASE("InMemoryAssetTransfer balances", "[transfer]") {
    InMemoryAssetTransfer transfer;
    transfer.mint(X, ALICE, 1000);

    SECTION("Pull then push") {
        transfer.pull(X, ALICE, 400);
        REQUIRE(transfer.balance_of(X, ALICE) == 600);
        REQUIRE(transfer.custody_balance(X) == 400);

        transfer.push(X, BOB, 150);
        REQUIRE(transfer.balance_of(X, BOB) == 150);
        REQUIRE(transfer.custody_balance(X) == 250);
        REQUIRE(transfer.transfer_count() == 2);
    }

    SECTION("Pull beyond the balance moves nothing") {
        REQUIRE(error_code_of([&] { transfer.pull(X, ALICE, 1001); }) == ErrorCode::TransferFailed);
        REQUIRE(transfer.balance_of(X, ALICE) == 1000);
        REQUIRE(transfer.custody_balance(X) == 0);
    }

    SECTION("Push beyond custody moves nothing") {
        transfer.pull(X, ALICE, 10);
        REQUIRE(error_code_of([&] { transfer.push(X, BOB, 11); }) == ErrorCode::TransferFailed);
        REQUIRE(transfer.custody_balance(X) == 10);
        REQUIRE(transfer.balance_of(X, BOB) == 0);
    }

    SECTION("Blocked holders") {
        transfer.set_blocked(ALICE, true);
        REQUIRE(error_code_of([&] { transfer.pull(X, ALICE, 1); }) == ErrorCode::TransferFailed);

        transfer.set_blocked(ALICE, false);
        transfer.pull(X, ALICE, 1);
        transfer.set_blocked(BOB, true);
        REQUIRE(error_code_of([&] { transfer.push(X, BOB, 1); }) == ErrorCode::TransferFailed);
    }

    SECTION("Zero amounts are no-ops") {
        transfer.pull(X, BOB, 0);
        transfer.push(Y, BOB, 0);
        REQUIRE(transfer.transfer_count() == 0);
    }

    SECTION("Hook observes each call before it applies") {
        std::vector<InMemoryAssetTransfer::Direction> seen;
        transfer.set_transfer_hook([&](InMemoryAssetTransfer::Direction dir, const Asset&,
                                       const Address&, Amount) {
            seen.push_back(dir);
            REQUIRE(transfer.custody_balance(X) == (seen.size() == 1 ? 0 : 5));
        });
        transfer.pull(X, ALICE, 5);
        transfer.push(X, BOB, 5);
        std::vector<InMemoryAssetTransfer::Direction> expected{
            InMemoryAssetTransfer::Direction::Pull, InMemoryAssetTransfer::Direction::Push};
        REQUIRE(seen == expected);
    }

    SECTION("Hook can be replaced while transfers run") {
        std::atomic<int> calls{0};
        std::thread replacer([&] {
            for (int i = 0; i < 200; ++i) {
                if (i % 2) {
                    transfer.set_transfer_hook(
                        [&](InMemoryAssetTransfer::Direction, const Asset&, const Address&, Amount) {
                            calls++;
                        });
                } else {
                    transfer.set_transfer_hook(nullptr);
                }
            }
        });
        for (int i = 0; i < 200; ++i) {
            transfer.pull(X, ALICE, 1);
        }
        replacer.join();

        REQUIRE(transfer.balance_of(X, ALICE) == 800);
        REQUIRE(transfer.custody_balance(X) == 200);
        REQUIRE(calls.load() <= 200);
    }
}

TEST_CASE("SingleOwnerAuthorization", "[auth]") {
    SingleOwnerAuthorization auth(OWNER);

    SECTION("Owner holds the fee setter role") {
        REQUIRE_NOTHROW(auth.require_role(OWNER, Role::FeeSetter));
        REQUIRE(error_code_of([&] { auth.require_role(ALICE, Role::FeeSetter); })
                == ErrorCode::Unauthorized);
    }

    SECTION("Ownership transfer") {
        REQUIRE(error_code_of([&] { auth.transfer_ownership(ALICE, ALICE); })
                == ErrorCode::Unauthorized);
        REQUIRE(error_code_of([&] { auth.transfer_ownership(OWNER, NULL_ADDRESS); })
                == ErrorCode::InvalidAddress);

        auth.transfer_ownership(OWNER, ALICE);
        REQUIRE(auth.owner() == ALICE);
        REQUIRE_NOTHROW(auth.require_role(ALICE, Role::FeeSetter));
        REQUIRE_THROWS_AS(auth.require_role(OWNER, Role::FeeSetter), SwapError);
    }

    SECTION("Null owner") {
        REQUIRE_THROWS_AS(SingleOwnerAuthorization(NULL_ADDRESS), SwapError);
    }
}

namespace {

class RecordingListener : public EventListener {
public:
    std::vector<uint64_t> sequences;
    std::vector<std::string> names;

    void on_event(const Event& event) override {
        sequences.push_back(event.sequence);
        names.emplace_back(event_name(event.payload));
    }
};

class ThrowingListener : public EventListener {
public:
    int calls = 0;

    void on_event(const Event&) override {
        calls++;
        throw std::runtime_error("listener failed");
    }
};

} // anonymous namespace

TEST_CASE("EventLog", "[events]") {
    EventLog event_log;
    RecordingListener listener;
    event_log.subscribe(&listener);

    auto first = event_log.append({PairCreated{X, Y}});
    auto second = event_log.append({SwapExecuted{ALICE, BOB, X, Y, 100, 90}, FeeUpdated{30, 50}});

    SECTION("Sequences are dense and increasing") {
        REQUIRE(first.size() == 1);
        REQUIRE(first[0].sequence == 1);
        REQUIRE(second[0].sequence == 2);
        REQUIRE(second[1].sequence == 3);
        REQUIRE(event_log.size() == 3);
        REQUIRE(event_log.last_sequence() == 3);
    }

    SECTION("Append does not notify") {
        REQUIRE(listener.sequences.empty());
        event_log.notify(second);
        std::vector<uint64_t> sequences{2, 3};
        std::vector<std::string> names{"SwapExecuted", "FeeUpdated"};
        REQUIRE(listener.sequences == sequences);
        REQUIRE(listener.names == names);
    }

    SECTION("Polling") {
        auto tail = event_log.events_since(1);
        REQUIRE(tail.size() == 2);
        REQUIRE(tail[0].as<SwapExecuted>()->amount_out == 90);
        REQUIRE(tail[1].as<SwapExecuted>() == nullptr);
        REQUIRE(event_log.events_since(3).empty());
        REQUIRE(event_log.events_since(0).size() == 3);
    }

    SECTION("A throwing listener does not stop delivery") {
        ThrowingListener throwing;
        event_log.unsubscribe(&listener);
        event_log.subscribe(&throwing);
        event_log.subscribe(&listener);

        REQUIRE_NOTHROW(event_log.notify(second));
        REQUIRE(throwing.calls == 2);
        std::vector<uint64_t> sequences{2, 3};
        REQUIRE(listener.sequences == sequences);
    }

    SECTION("Unsubscribe") {
        event_log.unsubscribe(&listener);
        event_log.notify(first);
        REQUIRE(listener.sequences.empty());
    }
}
