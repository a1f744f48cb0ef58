/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/balance-calculator.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

suite crank_balance_calculator_suite = [] {
    "crank::balance_calculator"_test = [] {
        "defaults"_test = [] {
            const fee_schedule fees {};
            test_same(uint64_t { 890'880 }, fees.rent_exempt_reserve);
            test_same(uint64_t { 4'677'120 }, fees.miner_rent);
            test_same(size_t { 25 }, num_squares(squares_mask_all));
            test_same(size_t { 4 }, num_squares(0xF));
            test_same(size_t { 25 }, num_squares(0xFFFFFFFF));
        };
        "required reserve"_test = [] {
            const balance_calculator calc {};
            const auto rsv = calc.required_reserve(balance_inputs { .bps_fee=100, .flat_fee=50 }, 10'000, squares_mask_all);
            test_same(uint64_t { 250'000 }, rsv.deployed);
            test_same(uint64_t { 5'828'000 }, rsv.required);
            test_same(uint64_t { 5'828'000 }, rsv.shortfall);
            test_same(uint64_t { 3'050 }, rsv.service_fee);
            test_same(uint64_t { 6'721'930 }, rsv.funding);
            test_same(uint64_t { 6'721'930 }, rsv.funding_shortfall);
            const auto with_auth = calc.required_reserve(balance_inputs { .cached_balance=5'000'000, .auth_balance=28'000 }, 10'000, squares_mask_all);
            test_same(uint64_t { 5'800'000 }, with_auth.required);
            test_same(uint64_t { 800'000 }, with_auth.shortfall);
            const auto with_miner = calc.required_reserve(balance_inputs { .cached_balance=2'000'000, .miner_exists=true }, 10'000, squares_mask_all);
            test_same(uint64_t { 1'150'880 }, with_miner.required);
            test_same(uint64_t { 0 }, with_miner.shortfall);
            test_same(uint64_t { 1'150'880 + 500 + 890'880 }, with_miner.funding);
            test_same(uint64_t { 42'260 }, with_miner.funding_shortfall);
        };
        "fees come out of the same balance"_test = [] {
            const balance_calculator calc { fee_schedule { 0, 5'000, 0, 500, 1'000 } };
            const auto rsv = calc.required_reserve(balance_inputs { .cached_balance=45'000, .bps_fee=100 }, 10'000, 0xF);
            test_same(uint64_t { 45'000 }, rsv.required);
            test_same(uint64_t { 0 }, rsv.shortfall);
            test_same(uint64_t { 900 }, rsv.service_fee);
            test_same(uint64_t { 46'900 }, rsv.funding);
            test_same(uint64_t { 1'900 }, rsv.funding_shortfall);
        };
        "auth balance covers everything"_test = [] {
            const balance_calculator calc { fee_schedule { 0, 5'000, 0, 0, 0 } };
            const auto rsv = calc.required_reserve(balance_inputs { .auth_balance=1'000'000 }, 10'000, 0xF);
            test_same(uint64_t { 0 }, rsv.required);
            test_same(uint64_t { 0 }, rsv.shortfall);
        };
        "monotonic in the amount and the squares"_test = [] {
            const balance_calculator calc {};
            uint64_t prev = 0;
            for (const uint64_t amount: { 0ULL, 1ULL, 1'000ULL, 10'000ULL, 1'000'000ULL }) {
                const auto req = calc.required_reserve(balance_inputs {}, amount, squares_mask_all).required;
                expect(req >= prev);
                prev = req;
            }
            prev = 0;
            for (uint32_t mask = 0; mask <= squares_mask_all; mask = (mask << 1) | 1) {
                const auto req = calc.required_reserve(balance_inputs {}, 10'000, mask).required;
                expect(req >= prev);
                prev = req;
                if (mask == squares_mask_all)
                    break;
            }
        };
        "saturation"_test = [] {
            constexpr auto max = std::numeric_limits<uint64_t>::max();
            test_same(max, saturating_add(max, 1));
            test_same(max, saturating_mul(max, 2));
            test_same(uint64_t { 0 }, saturating_mul(0, max));
            const balance_calculator calc {};
            const auto rsv = calc.required_reserve(balance_inputs { .bps_fee=max }, max, squares_mask_all);
            test_same(max, rsv.deployed);
            test_same(max, rsv.required);
            test_same(max / 10'000 + 500, rsv.service_fee);
            test_same(max, rsv.funding);
        };
        "miner probe cache"_test = [] {
            miner_probe_cache cache {};
            const auto miner = ledger::mock_address(3);
            expect(!cache.exists(miner, false));
            test_same(size_t { 0 }, cache.size());
            expect(cache.exists(miner, true));
            expect(cache.exists(miner, false));
            test_same(size_t { 1 }, cache.size());
        };
    };
};
