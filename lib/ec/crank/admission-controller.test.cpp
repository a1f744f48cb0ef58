/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/admission-controller.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

namespace {
    deployer make_deployer(const uint8_t id)
    {
        deployer dep {};
        dep.record.manager = ledger::mock_address(0x40 + id);
        dep.addrs = ledger::deployer_addresses::derive(dep.record.manager, 0);
        dep.address = dep.addrs.deployer.address;
        return dep;
    }

    ledger::miner_record make_miner(const uint64_t round_id, const uint64_t checkpoint_id)
    {
        ledger::miner_record m {};
        m.round_id = round_id;
        m.checkpoint_id = checkpoint_id;
        return m;
    }

    // 10'000 lamports on four squares plus the checkpoint fee
    constexpr uint64_t required = 45'000;
    constexpr uint64_t round_id = 5;
}

suite crank_admission_controller_suite = [] {
    "crank::admission_controller"_test = [] {
        const balance_calculator calc { fee_schedule { 0, 5'000, 0, 0, 0 } };
        "three outcomes"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const auto rich = make_deployer(1);
            const auto owing = make_deployer(2);
            const auto poor = make_deployer(3);
            const deployer_view_list views {
                { rich, deployer_state { .autodeploy_balance=required, .miner_exists=true } },
                { owing, deployer_state { .autodeploy_balance=10'000, .miner_exists=true, .miner=make_miner(4, 3) } },
                { poor, deployer_state { .autodeploy_balance=required - 1 } }
            };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(fatal(res.to_deploy.size() == 1));
            test_same(rich.address, res.to_deploy.at(0).dep.address);
            expect(!res.to_deploy.at(0).checkpoint_round);
            test_same(uint64_t { 10'000 }, res.to_deploy.at(0).amount_per_square);
            test_same(uint32_t { 0xF }, res.to_deploy.at(0).squares_mask);
            expect(fatal(res.to_checkpoint_only.size() == 1));
            test_same(owing.address, res.to_checkpoint_only.at(0).dep.address);
            test_same(std::optional<uint64_t> { 4 }, res.to_checkpoint_only.at(0).checkpoint_round);
            expect(fatal(res.skips.size() == 1));
            test_same(poor.address, res.skips.at(0).deployer);
            test_same(skip_reason::insufficient_balance, res.skips.at(0).reason);
        };
        "admitted with a checkpoint"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const auto dep = make_deployer(1);
            const deployer_view_list views { { dep, deployer_state { .autodeploy_balance=required, .miner_exists=true, .miner=make_miner(4, 3) } } };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(fatal(res.to_deploy.size() == 1));
            test_same(std::optional<uint64_t> { 4 }, res.to_deploy.at(0).checkpoint_round);
            expect(res.to_checkpoint_only.empty());
        };
        "the current round is not checkpointed"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const auto funded = make_deployer(1);
            const auto unfunded = make_deployer(2);
            const deployer_view_list views {
                { funded, deployer_state { .autodeploy_balance=required, .miner_exists=true, .miner=make_miner(round_id, 3) } },
                { unfunded, deployer_state { .autodeploy_balance=0, .miner_exists=true, .miner=make_miner(round_id, 3) } }
            };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(fatal(res.to_deploy.size() == 1));
            expect(!res.to_deploy.at(0).checkpoint_round);
            expect(res.to_checkpoint_only.empty());
            expect(fatal(res.skips.size() == 1));
            test_same(skip_reason::insufficient_balance, res.skips.at(0).reason);
        };
        "already completed"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const auto dep = make_deployer(1);
            tracker.mark_submitted(dep.address, round_id);
            const deployer_view_list views { { dep, deployer_state { .autodeploy_balance=required * 10 } } };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(res.to_deploy.empty());
            expect(fatal(res.skips.size() == 1));
            test_same(skip_reason::already_completed, res.skips.at(0).reason);
            const auto next = ac.evaluate(views, round_id + 1, 10'000, 0xF);
            test_same(size_t { 1 }, next.to_deploy.size());
        };
        "fees and rent must be covered too"_test = [] {
            const balance_calculator fee_calc { fee_schedule { 0, 5'000, 0, 500, 1'000 } };
            completion_tracker_memory tracker {};
            const admission_controller ac { fee_calc, tracker };
            auto short_by_fees = make_deployer(1);
            short_by_fees.record.bps_fee = 100;
            auto funded = make_deployer(2);
            funded.record.bps_fee = 100;
            auto owing = make_deployer(3);
            owing.record.bps_fee = 100;
            // 400 lamports of the deployer's fee, 500 of the deploy fee and 1'000 of rent on top of the required reserve
            const deployer_view_list views {
                { short_by_fees, deployer_state { .autodeploy_balance=required, .miner_exists=true } },
                { funded, deployer_state { .autodeploy_balance=required + 1'900, .miner_exists=true } },
                { owing, deployer_state { .autodeploy_balance=required + 1'899, .miner_exists=true, .miner=make_miner(4, 3) } }
            };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(fatal(res.to_deploy.size() == 1));
            test_same(funded.address, res.to_deploy.at(0).dep.address);
            expect(fatal(res.to_checkpoint_only.size() == 1));
            test_same(owing.address, res.to_checkpoint_only.at(0).dep.address);
            expect(fatal(res.skips.size() == 1));
            test_same(short_by_fees.address, res.skips.at(0).deployer);
            test_same(skip_reason::insufficient_balance, res.skips.at(0).reason);
        };
        "decode error"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const auto dep = make_deployer(1);
            const deployer_view_list views { { dep, deployer_state { .autodeploy_balance=required, .decode_failure="a miner record has 12 bytes" } } };
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(res.to_deploy.empty());
            expect(fatal(res.skips.size() == 1));
            test_same(skip_reason::decode_error, res.skips.at(0).reason);
        };
        "order is preserved"_test = [&] {
            completion_tracker_memory tracker {};
            const admission_controller ac { calc, tracker };
            const deployer_list deps { make_deployer(3), make_deployer(1), make_deployer(2) };
            deployer_view_list views {};
            for (const auto &d: deps)
                views.emplace_back(deployer_view { d, deployer_state { .autodeploy_balance=required } });
            const auto res = ac.evaluate(views, round_id, 10'000, 0xF);
            expect(fatal(res.to_deploy.size() == deps.size()));
            for (size_t i = 0; i < deps.size(); ++i)
                test_same(deps[i].address, res.to_deploy[i].dep.address);
        };
    };
};
