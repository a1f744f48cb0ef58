/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/scheduler.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

namespace {
    // Two funded deployers need 45'000 lamports each: 10'000 on four squares plus the checkpoint fee.
    struct fixture {
        ledger::keypair kp = ledger::mock_keypair(1);
        ledger::reader_mock m {};
        vector<std::chrono::milliseconds> sleeps {};
        settings cfg {};
        deployer_list deps {};

        explicit fixture(const size_t num_deployers, const uint64_t balance=100'000)
        {
            cfg.amount_per_square = 10'000;
            cfg.squares_mask = 0xF;
            cfg.fees = fee_schedule { 0, 5'000, 0, 0, 0 };
            m.set_board(5, 0, 1000);
            m.slot = 900;
            for (size_t i = 0; i < num_deployers; ++i) {
                deployer d {};
                d.record.manager = ledger::mock_address(static_cast<uint8_t>(0x40 + i));
                d.record.deploy_authority = kp.public_key;
                d.addrs = ledger::deployer_addresses::derive(d.record.manager, cfg.auth_id);
                d.address = m.add_deployer(d.record, cfg.auth_id);
                m.set_balance(d.addrs.autodeploy_balance.address, balance);
                deps.emplace_back(std::move(d));
            }
        }

        std::unique_ptr<context> make_context()
        {
            return std::make_unique<context>(m, cfg, kp, deps, [this](const std::chrono::milliseconds d) { sleeps.emplace_back(d); });
        }

        void set_miner(const deployer &d, const uint64_t round_id, const uint64_t checkpoint_id)
        {
            ledger::miner_record miner {};
            miner.authority = d.addrs.managed_miner_auth.address;
            miner.round_id = round_id;
            miner.checkpoint_id = checkpoint_id;
            m.set_account(d.addrs.ore_miner.address, miner.encode(), 1'000, ledger::program::ore());
        }
    };
}

suite crank_scheduler_suite = [] {
    "crank::scheduler"_test = [] {
        "deploys once per round"_test = [] {
            fixture f { 2 };
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            const auto sum = s.run_cycle();
            expect(!sum.error);
            expect(!sum.idle_reason);
            test_same(size_t { 1 }, sum.cycle);
            test_same(size_t { 2 }, sum.admitted);
            test_same(size_t { 1 }, sum.batches_submitted);
            test_same(size_t { 0 }, sum.batches_failed);
            test_same(size_t { 1 }, f.m.submitted.size());
            expect(fatal(s.pending().size() == 1));
            test_same(size_t { 2 }, s.pending().at(0).deployers.size());
            test_same(uint64_t { 5 }, s.pending().at(0).round_id);
            for (const auto &d: f.deps)
                expect(ctx->tracker->contains(d.address, 5));
            test_same(uint64_t { 100'000 }, ctx->deployers.at(0).cached_balance);
            expect(fmt::format("{}", sum).find("admitted: 2") != std::string::npos);

            f.m.slot = 901;
            const auto again = s.run_cycle();
            test_same(size_t { 0 }, again.admitted);
            expect(fatal(again.skips.size() == 2));
            test_same(skip_reason::already_completed, again.skips.at(0).reason);
            test_same(size_t { 1 }, f.m.submitted.size());
            expect(s.pending().empty());

            f.m.set_board(6, 1000, 2000);
            f.m.slot = 1900;
            const auto next = s.run_cycle();
            test_same(size_t { 2 }, next.admitted);
            test_same(size_t { 2 }, f.m.submitted.size());
            test_same(size_t { 2 }, ctx->tracker->size());
            expect(!ctx->tracker->contains(f.deps.at(0).address, 5));
        };
        "round gates"_test = [] {
            fixture f { 1 };
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            for (const uint64_t slot: { 500ULL, 995ULL, 1001ULL, 1100ULL }) {
                f.m.slot = slot;
                const auto sum = s.run_cycle();
                expect(static_cast<bool>(sum.idle_reason));
                expect(!sum.error);
            }
            f.m.set_board(5, 0, ledger::board_end_unbounded);
            expect(static_cast<bool>(s.run_cycle().idle_reason));
            test_same(size_t { 0 }, f.m.submitted.size());
        };
        "insufficient balance"_test = [] {
            fixture f { 1, 44'999 };
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            const auto sum = s.run_cycle();
            test_same(size_t { 0 }, sum.admitted);
            expect(fatal(sum.skips.size() == 1));
            test_same(skip_reason::insufficient_balance, sum.skips.at(0).reason);
            test_same(size_t { 0 }, f.m.submitted.size());
        };
        "ledger unavailable"_test = [] {
            fixture f { 1 };
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            f.m.unavailable = true;
            const auto sum = s.run_cycle();
            expect(static_cast<bool>(sum.error));
            expect(!sum.round);
            f.m.unavailable = false;
            const auto next = s.run_cycle();
            expect(!next.error);
            test_same(size_t { 1 }, next.batches_submitted);
        };
        "a rejected batch is retried"_test = [] {
            fixture f { 1 };
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            f.m.reject_submits = 1;
            const auto sum = s.run_cycle();
            test_same(size_t { 1 }, sum.batches_failed);
            test_same(size_t { 0 }, sum.batches_submitted);
            expect(!ctx->tracker->contains(f.deps.at(0).address, 5));
            expect(s.pending().empty());
            f.m.slot = 901;
            test_same(size_t { 1 }, s.run_cycle().batches_submitted);
            expect(ctx->tracker->contains(f.deps.at(0).address, 5));
        };
        "unconfirmed transactions expire"_test = [] {
            fixture f { 1 };
            f.m.default_status = ledger::confirmation_status::pending;
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            s.run_cycle();
            test_same(size_t { 1 }, s.pending().size());
            f.m.slot = 1000;
            s.run_cycle();
            test_same(size_t { 1 }, s.pending().size());
            f.m.slot = 900 + scheduler::confirmation_expiry_slots + 1;
            s.run_cycle();
            expect(s.pending().empty());
            test_same(size_t { 1 }, f.m.submitted.size());
        };
        "failed transactions are dropped"_test = [] {
            fixture f { 1 };
            f.m.default_status = ledger::confirmation_status::pending;
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            s.run_cycle();
            test_same(size_t { 1 }, s.pending().size());
            f.m.default_status = ledger::confirmation_status::failed;
            f.m.slot = 901;
            const auto sum = s.run_cycle();
            expect(s.pending().empty());
            // completion is optimistic so the deployer is not retried within the round
            test_same(size_t { 0 }, sum.batches_submitted);
        };
        "a pending checkpoint is not resubmitted"_test = [] {
            fixture f { 1, 0 };
            f.set_miner(f.deps.at(0), 4, 3);
            f.m.default_status = ledger::confirmation_status::pending;
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            const auto sum = s.run_cycle();
            test_same(size_t { 0 }, sum.admitted);
            test_same(size_t { 1 }, sum.checkpoint_only);
            test_same(size_t { 1 }, sum.batches_submitted);
            expect(fatal(s.pending().size() == 1));
            test_same(size_t { 1 }, s.pending().at(0).checkpointed.size());
            test_same(size_t { 0 }, ctx->tracker->size());

            f.m.slot = 901;
            const auto again = s.run_cycle();
            test_same(size_t { 0 }, again.checkpoint_only);
            expect(fatal(again.skips.size() == 1));
            test_same(f.deps.at(0).address, again.skips.at(0).deployer);
            test_same(skip_reason::checkpoint_pending, again.skips.at(0).reason);
            expect(fmt::format("{}", again).find("checkpoint_pending") != std::string::npos);
            test_same(size_t { 0 }, again.batches_submitted);
            test_same(size_t { 1 }, f.m.submitted.size());

            f.m.default_status = ledger::confirmation_status::confirmed;
            f.m.slot = 902;
            test_same(size_t { 1 }, s.run_cycle().batches_submitted);
            test_same(size_t { 2 }, f.m.submitted.size());
        };
        "an undecodable miner is skipped"_test = [] {
            fixture f { 1 };
            f.m.set_account(f.deps.at(0).addrs.ore_miner.address, uint8_vector::from_hex("0102"), 1'000, ledger::program::ore());
            const auto ctx = f.make_context();
            scheduler s { *ctx };
            const auto sum = s.run_cycle();
            expect(fatal(sum.skips.size() == 1));
            test_same(skip_reason::decode_error, sum.skips.at(0).reason);
            test_same(size_t { 0 }, f.m.submitted.size());
        };
        "run"_test = [] {
            fixture f { 0 };
            const auto ctx = f.make_context();
            std::chrono::steady_clock::time_point now {};
            scheduler s { *ctx, [&] {
                now += std::chrono::milliseconds { 100 };
                return now;
            } };
            std::atomic_bool stop { false };
            test_same(size_t { 3 }, s.run(3, stop));
            test_same(vector<std::chrono::milliseconds> { std::chrono::milliseconds { 300 }, std::chrono::milliseconds { 300 } }, f.sleeps);
            stop = true;
            test_same(size_t { 0 }, s.run({}, stop));
        };
        "a tracker is required"_test = [] {
            fixture f { 0 };
            expect(throws([&] {
                context ctx { f.m, f.cfg, f.kp, f.deps, [](const std::chrono::milliseconds) {}, nullptr };
            }));
        };
    };
};
