/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/transaction-submitter.hpp>
#include <ec/ledger/instructions.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

namespace {
    ledger::instruction_list deploy_instructions(const ledger::pubkey &signer, const size_t num_deploys, ledger::pubkey_list &candidates)
    {
        ledger::instruction_list ixs {
            ledger::compute_budget::set_unit_limit(400'000),
            ledger::compute_budget::set_unit_price(100'000)
        };
        candidates = ledger::shared_addresses::get().lookup_candidates();
        for (size_t i = 0; i < num_deploys; ++i) {
            const auto manager = ledger::mock_address(static_cast<uint8_t>(0x40 + i));
            const auto addrs = ledger::deployer_addresses::derive(manager, 0);
            for (const auto &a: addrs.lookup_candidates(manager))
                candidates.emplace_back(a);
            ixs.emplace_back(ledger::evore::mm_autodeploy(signer, manager, addrs, ledger::evore::autodeploy_params {
                .round_id=7, .amount=10'000, .squares_mask=0x1FFFFFF
            }));
        }
        return ixs;
    }
}

suite crank_transaction_submitter_suite = [] {
    "crank::transaction_submitter"_test = [] {
        const auto kp = ledger::mock_keypair(1);
        "two deploys fit without a table"_test = [&] {
            ledger::reader_mock m {};
            transaction_submitter sub { m, kp };
            test_same(kp.public_key, sub.payer());
            ledger::pubkey_list candidates {};
            const auto res = sub.submit(deploy_instructions(kp.public_key, 2, candidates));
            expect(fatal(static_cast<bool>(res)));
            test_same(size_t { 1 }, m.submitted.size());
            test_same(m.submitted.at(0).size(), res.tx_size);
            expect(res.tx_size <= ledger::max_tx_size);
            test_same(size_t { 23 }, res.num_accounts);
            const auto tx = sub.build(deploy_instructions(kp.public_key, 2, candidates), m.recent_blockhash);
            test_same(tx.signatures.at(0), *res.sig);
        };
        "five deploys need a table"_test = [&] {
            ledger::reader_mock m {};
            transaction_submitter sub { m, kp };
            ledger::pubkey_list candidates {};
            const auto ixs = deploy_instructions(kp.public_key, 5, candidates);
            expect(throws<submit_rejected>([&] { sub.build(ixs, m.recent_blockhash); }));
            const auto res = sub.submit(ixs);
            expect(!res);
            expect(fatal(static_cast<bool>(res.error)));
            expect(res.error->starts_with("submit-rejected"));
            expect(m.submitted.empty());

            const ledger::address_table table { ledger::mock_address(0x77), candidates };
            const auto acc_res = sub.submit(ixs, table);
            expect(fatal(static_cast<bool>(acc_res)));
            expect(acc_res.tx_size <= ledger::max_tx_size);
            test_same(size_t { 1 }, m.submitted.size());
        };
        "ledger failures are reported"_test = [&] {
            ledger::reader_mock m {};
            transaction_submitter sub { m, kp };
            const ledger::instruction_list ixs { ledger::system_program::transfer(kp.public_key, kp.public_key, 0) };
            m.reject_submits = 1;
            const auto rejected = sub.submit(ixs);
            expect(!rejected);
            expect(rejected.error->starts_with("submit-rejected"));
            m.unavailable = true;
            const auto unavailable = sub.submit(ixs);
            expect(!unavailable);
            expect(unavailable.error->starts_with("ledger-unavailable"));
            m.unavailable = false;
            expect(static_cast<bool>(sub.submit(ixs)));
            test_same(size_t { 1 }, m.submitted.size());
        };
    };
};
