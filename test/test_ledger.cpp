// ZSwap - Pair Ledger / Staged Transaction Tests

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"
#include "zswap/uint256.hpp"

using namespace zswap;
using namespace zswap::testing;

namespace {

// Create (a, b) and deposit the given amounts in one applied txn
AddLiquidityResult open_pool(PairLedger& ledger, const Asset& a, const Asset& b,
                             Amount amount_a, Amount amount_b, const Address& lp = ALICE) {
    LedgerTxn txn(ledger);
    txn.create_pair(a, b);
    auto result = txn.add_liquidity(AddLiquidityParams{a, b, amount_a, amount_b, 0, 0, lp});
    ledger.apply(txn);
    return result;
}

} // anonymous namespace

TEST_CASE("Pair creation", "[ledger]") {
    PairLedger ledger;

    SECTION("Either ordering maps to one canonical pool") {
        LedgerTxn txn(ledger);
        PairKey key = txn.create_pair(Y, X);
        REQUIRE(key.low == X);
        REQUIRE(key.high == Y);
        ledger.apply(txn);

        REQUIRE(ledger.get_pool(PairKey::sorted(X, Y)).has_value());
        REQUIRE(ledger.pair_count() == 1);

        LedgerTxn again(ledger);
        REQUIRE(error_code_of([&] { again.create_pair(X, Y); }) == ErrorCode::PairExists);
        REQUIRE(error_code_of([&] { again.create_pair(Y, X); }) == ErrorCode::PairExists);
    }

    SECTION("Identical and null assets") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] { txn.create_pair(X, X); }) == ErrorCode::IdenticalAssets);
        REQUIRE(error_code_of([&] { txn.create_pair(X, NULL_ASSET); }) == ErrorCode::NullAsset);
        REQUIRE(error_code_of([&] { txn.create_pair(NULL_ASSET, Y); }) == ErrorCode::NullAsset);
    }

    SECTION("New pool starts empty") {
        LedgerTxn txn(ledger);
        txn.create_pair(X, Y);
        ledger.apply(txn);

        auto pool = ledger.get_pool(PairKey::sorted(X, Y));
        REQUIRE(pool->exists);
        REQUIRE(pool->reserve_low == 0);
        REQUIRE(pool->reserve_high == 0);
        REQUIRE(pool->total_shares == 0);
    }

    SECTION("Pairs are listed in creation order") {
        LedgerTxn txn(ledger);
        txn.create_pair(Z, W);
        txn.create_pair(Y, X);
        ledger.apply(txn);

        auto pairs = ledger.pairs();
        REQUIRE(pairs.size() == 2);
        REQUIRE(pairs[0] == PairKey::sorted(Z, W));
        REQUIRE(pairs[1] == PairKey::sorted(X, Y));
    }
}

TEST_CASE("Dropped txn leaves the ledger untouched", "[ledger]") {
    PairLedger ledger;
    {
        LedgerTxn txn(ledger);
        txn.create_pair(X, Y);
        txn.add_liquidity(AddLiquidityParams{X, Y, 1000000, 1000000, 0, 0, ALICE});
        txn.set_fee_rate(100);

        // Staged reads see the overlay
        REQUIRE(txn.pool(PairKey::sorted(X, Y))->total_shares == 1000000);
        REQUIRE(txn.fee_rate() == 100);
    }

    REQUIRE_FALSE(ledger.get_pool(PairKey::sorted(X, Y)).has_value());
    REQUIRE(ledger.pair_count() == 0);
    REQUIRE(ledger.fee_rate() == DEFAULT_FEE_RATE_BPS);
}

TEST_CASE("First deposit", "[ledger]") {
    PairLedger ledger;

    SECTION("Lock is credited to the null address") {
        auto result = open_pool(ledger, X, Y, 1000000, 1000000);
        REQUIRE(result.shares == 999000);

        PairKey key = PairKey::sorted(X, Y);
        auto pool = ledger.get_pool(key);
        REQUIRE(pool->reserve_low == 1000000);
        REQUIRE(pool->reserve_high == 1000000);
        REQUIRE(pool->total_shares == 1000000);

        auto lock = ledger.get_position(key, NULL_ADDRESS);
        REQUIRE(lock->share_amount == MINIMUM_LIQUIDITY);

        auto alice = ledger.get_position(key, ALICE);
        REQUIRE(alice->share_amount == 999000);
        REQUIRE(alice->share_ratio == Amount(999) * SHARE_RATIO_SCALE / 1000);
    }

    SECTION("Smallest deposit that clears the lock mints one share") {
        REQUIRE(open_pool(ledger, X, Y, 1001, 1001).shares == 1);
    }

    SECTION("Deposit that does not clear the lock") {
        LedgerTxn txn(ledger);
        txn.create_pair(X, Y);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 1000, 1000, 0, 0, ALICE});
        }) == ErrorCode::InsufficientLiquidityMinted);
    }

    SECTION("Stages both pulls from the depositor") {
        LedgerTxn txn(ledger);
        txn.create_pair(X, Y);
        txn.add_liquidity(AddLiquidityParams{Y, X, 4000000, 1000000, 0, 0, ALICE});

        const auto& transfers = txn.transfers();
        REQUIRE(transfers.size() == 2);
        REQUIRE(transfers[0].kind == StagedTransfer::Kind::Pull);
        REQUIRE(transfers[0].asset == Y);
        REQUIRE(transfers[0].amount == 4000000);
        REQUIRE(transfers[1].asset == X);
        REQUIRE(transfers[1].amount == 1000000);
        REQUIRE(transfers[1].holder == ALICE);

        REQUIRE(txn.events().size() == 2);
        const auto* added = std::get_if<LiquidityAdded>(&txn.events()[1]);
        REQUIRE(added != nullptr);
        REQUIRE(added->amount_low == 1000000);    // X is the low side
        REQUIRE(added->amount_high == 4000000);
        REQUIRE(added->shares == 1999000);
    }

    SECTION("Missing pair, null depositor, zero amounts") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 5000, 5000, 0, 0, ALICE});
        }) == ErrorCode::PairDoesNotExist);

        txn.create_pair(X, Y);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 5000, 5000, 0, 0, NULL_ADDRESS});
        }) == ErrorCode::InvalidAddress);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 0, 5000, 0, 0, ALICE});
        }) == ErrorCode::InvalidAmount);
    }
}

TEST_CASE("Later deposits keep the price", "[ledger]") {
    PairLedger ledger;
    open_pool(ledger, X, Y, 1000000, 2000000);
    PairKey key = PairKey::sorted(X, Y);
    Amount total_before = ledger.get_pool(key)->total_shares;

    SECTION("Holds the first amount fixed") {
        LedgerTxn txn(ledger);
        auto result = txn.add_liquidity(AddLiquidityParams{X, Y, 1000, 5000, 0, 0, BOB});
        REQUIRE(result.amount_a == 1000);
        REQUIRE(result.amount_b == 2000);
        REQUIRE(txn.pool(key)->total_shares > total_before);
    }

    SECTION("Swaps roles when the second amount is short") {
        LedgerTxn txn(ledger);
        auto result = txn.add_liquidity(AddLiquidityParams{X, Y, 5000, 2000, 0, 0, BOB});
        REQUIRE(result.amount_a == 1000);
        REQUIRE(result.amount_b == 2000);
    }

    SECTION("Caller order is preserved in the result") {
        LedgerTxn txn(ledger);
        auto result = txn.add_liquidity(AddLiquidityParams{Y, X, 2000, 5000, 0, 0, BOB});
        REQUIRE(result.amount_a == 2000);   // Y
        REQUIRE(result.amount_b == 1000);   // X
    }

    SECTION("Minimum bounds") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 1000, 5000, 0, 2001, BOB});
        }) == ErrorCode::InsufficientAmount);
        REQUIRE(error_code_of([&] {
            txn.add_liquidity(AddLiquidityParams{X, Y, 5000, 2000, 1001, 0, BOB});
        }) == ErrorCode::InsufficientAmount);
    }
}

TEST_CASE("Remove liquidity", "[ledger]") {
    PairLedger ledger;
    open_pool(ledger, X, Y, 1000000, 4000000);
    PairKey key = PairKey::sorted(X, Y);

    SECTION("Redeems a proportional slice") {
        LedgerTxn txn(ledger);
        auto result = txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1999000, 0, 0, ALICE});
        // total 2000000 shares over (1000000, 4000000)
        REQUIRE(result.amount_a == 999500);
        REQUIRE(result.amount_b == 3998000);
        ledger.apply(txn);

        auto pool = ledger.get_pool(key);
        REQUIRE(pool->total_shares == MINIMUM_LIQUIDITY);
        REQUIRE(pool->reserve_low == 500);
        REQUIRE(pool->reserve_high == 2000);
        REQUIRE(ledger.get_position(key, ALICE)->share_amount == 0);
        REQUIRE(ledger.get_position(key, ALICE)->share_ratio == 0);
    }

    SECTION("Stages pushes to the depositor") {
        LedgerTxn txn(ledger);
        txn.remove_liquidity(RemoveLiquidityParams{Y, X, 1000, 0, 0, ALICE});
        REQUIRE(txn.transfers().size() == 2);
        REQUIRE(txn.transfers()[0].kind == StagedTransfer::Kind::Push);
        REQUIRE(txn.transfers()[0].asset == Y);
        REQUIRE(txn.transfers()[0].amount == 2000);
        REQUIRE(txn.transfers()[1].asset == X);
        REQUIRE(txn.transfers()[1].amount == 500);
    }

    SECTION("More shares than held") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1999001, 0, 0, ALICE});
        }) == ErrorCode::InsufficientShares);
        REQUIRE(error_code_of([&] {
            txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1, 0, 0, BOB});
        }) == ErrorCode::InsufficientShares);
    }

    SECTION("Shares that redeem nothing on one side") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1, 0, 0, ALICE});
        }) == ErrorCode::InsufficientAmount);
    }

    SECTION("Minimum bounds") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1000, 501, 0, ALICE});
        }) == ErrorCode::InsufficientAmount);
    }

    SECTION("Locked shares cannot be withdrawn") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] {
            txn.remove_liquidity(RemoveLiquidityParams{X, Y, 1000, 0, 0, NULL_ADDRESS});
        }) == ErrorCode::InvalidAddress);
    }
}

TEST_CASE("Shares move monotonically", "[ledger]") {
    PairLedger ledger;
    open_pool(ledger, X, Y, 1000000, 1000000);
    PairKey key = PairKey::sorted(X, Y);

    Amount total = ledger.get_pool(key)->total_shares;
    for (Amount deposit : {Amount(1000), Amount(77777), Amount(500000)}) {
        LedgerTxn txn(ledger);
        txn.add_liquidity(AddLiquidityParams{X, Y, deposit, deposit, 0, 0, BOB});
        ledger.apply(txn);
        Amount next = ledger.get_pool(key)->total_shares;
        REQUIRE(next > total);
        total = next;
    }

    for (Amount burn : {Amount(1000), Amount(50000)}) {
        LedgerTxn txn(ledger);
        txn.remove_liquidity(RemoveLiquidityParams{X, Y, burn, 0, 0, BOB});
        ledger.apply(txn);
        Amount next = ledger.get_pool(key)->total_shares;
        REQUIRE(next < total);
        total = next;
    }

    // Positions always sum to the pool's total
    Amount held = ledger.get_position(key, NULL_ADDRESS)->share_amount +
                  ledger.get_position(key, ALICE)->share_amount +
                  ledger.get_position(key, BOB)->share_amount;
    REQUIRE(held == total);
}

TEST_CASE("Swap hop", "[ledger]") {
    PairLedger ledger;
    open_pool(ledger, X, Y, 1000000, 1000000);
    PairKey key = PairKey::sorted(X, Y);

    SECTION("Moves reserves and keeps k from falling") {
        auto before = *ledger.get_pool(key);
        LedgerTxn txn(ledger);
        Amount out = txn.swap_hop(X, Y, 10000, BOB, CAROL);
        REQUIRE(out == 9871);

        auto after = *txn.pool(key);
        REQUIRE(after.reserve_low == 1010000);
        REQUIRE(after.reserve_high == 990129);
        REQUIRE(math::mul_wide(after.reserve_low, after.reserve_high) >=
                math::mul_wide(before.reserve_low, before.reserve_high));

        const auto* swapped = std::get_if<SwapExecuted>(&txn.events().back());
        REQUIRE(swapped != nullptr);
        REQUIRE(swapped->sender == BOB);
        REQUIRE(swapped->recipient == CAROL);
        REQUIRE(swapped->asset_in == X);
        REQUIRE(swapped->amount_out == 9871);
    }

    SECTION("Reverse direction") {
        LedgerTxn txn(ledger);
        REQUIRE(txn.swap_hop(Y, X, 10000, BOB, BOB) == 9871);
        REQUIRE(txn.pool(key)->reserve_high == 1010000);
        REQUIRE(txn.pool(key)->reserve_low == 990129);
    }

    SECTION("Output that truncates to zero") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] { txn.swap_hop(X, Y, 1, BOB, BOB); })
                == ErrorCode::InsufficientOutputAmount);
    }

    SECTION("Unknown pair") {
        LedgerTxn txn(ledger);
        REQUIRE(error_code_of([&] { txn.swap_hop(X, Z, 1000, BOB, BOB); })
                == ErrorCode::PairDoesNotExist);
    }

    SECTION("Uses the staged fee rate") {
        LedgerTxn txn(ledger);
        txn.set_fee_rate(0);
        REQUIRE(txn.swap_hop(X, Y, 1000000, BOB, BOB) == 500000);
    }
}

TEST_CASE("Reserves are capped", "[ledger]") {
    PairLedger ledger;
    open_pool(ledger, X, Y, MAX_RESERVE, MAX_RESERVE);

    LedgerTxn txn(ledger);
    REQUIRE(error_code_of([&] { txn.swap_hop(X, Y, 1000000, BOB, BOB); })
            == ErrorCode::ReserveOverflow);
    REQUIRE(error_code_of([&] {
        txn.add_liquidity(AddLiquidityParams{X, Y, 1000, 1000, 0, 0, BOB});
    }) == ErrorCode::ReserveOverflow);
}

TEST_CASE("Fee rate", "[ledger]") {
    PairLedger ledger;

    LedgerTxn txn(ledger);
    REQUIRE(error_code_of([&] { txn.set_fee_rate(MAX_FEE_RATE_BPS + 1); })
            == ErrorCode::FeeTooHigh);

    txn.set_fee_rate(MAX_FEE_RATE_BPS);
    REQUIRE(ledger.fee_rate() == DEFAULT_FEE_RATE_BPS);

    const auto* updated = std::get_if<FeeUpdated>(&txn.events().back());
    REQUIRE(updated != nullptr);
    REQUIRE(updated->old_rate == DEFAULT_FEE_RATE_BPS);
    REQUIRE(updated->new_rate == MAX_FEE_RATE_BPS);

    ledger.apply(txn);
    REQUIRE(ledger.fee_rate() == MAX_FEE_RATE_BPS);
}
