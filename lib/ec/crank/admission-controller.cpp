/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/admission-controller.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    admission admission_controller::evaluate(const deployer_view_list &views, const uint64_t round_id, const uint64_t amount_per_square, const uint32_t squares_mask) const
    {
        admission res {};
        for (const auto &[dep, st]: views) {
            if (_tracker.contains(dep.address, round_id)) {
                res.skips.emplace_back(skipped_deployer { dep.address, skip_reason::already_completed });
                continue;
            }
            if (st.decode_failure) {
                logger::warn("deployer {}: {}", dep.address, *st.decode_failure);
                res.skips.emplace_back(skipped_deployer { dep.address, skip_reason::decode_error });
                continue;
            }
            std::optional<uint64_t> checkpoint_round {};
            // the current round can only be checkpointed once it is over
            if (st.miner && st.miner->checkpoint_owed() && st.miner->round_id < round_id)
                checkpoint_round = st.miner->round_id;
            const auto rsv = _calc.required_reserve(balance_inputs {
                .cached_balance=st.autodeploy_balance,
                .auth_balance=st.auth_balance,
                .miner_exists=st.miner_exists,
                .bps_fee=dep.record.bps_fee,
                .flat_fee=dep.record.flat_fee
            }, amount_per_square, squares_mask);
            deploy_intent intent { dep, amount_per_square, squares_mask, checkpoint_round };
            if (rsv.funding_shortfall == 0) {
                logger::debug("deployer {}: admitted with balance {} required {} and fees {}{}", dep.address, st.autodeploy_balance, rsv.required, rsv.service_fee,
                    checkpoint_round ? fmt::format(" after a checkpoint of round {}", *checkpoint_round) : std::string {});
                res.to_deploy.emplace_back(std::move(intent));
            } else if (checkpoint_round) {
                logger::debug("deployer {}: short by {} lamports, checkpointing round {} only", dep.address, rsv.funding_shortfall, *checkpoint_round);
                res.to_checkpoint_only.emplace_back(std::move(intent));
            } else {
                logger::debug("deployer {}: short by {} lamports", dep.address, rsv.funding_shortfall);
                res.skips.emplace_back(skipped_deployer { dep.address, skip_reason::insufficient_balance });
            }
        }
        return res;
    }
}
