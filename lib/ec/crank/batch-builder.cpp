/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/batch-builder.hpp>
#include <ec/ledger/instructions.hpp>

namespace evore_crank::crank {
    batch_builder::batch_builder(const ledger::pubkey &signer, const uint64_t auth_id, const uint64_t priority_fee):
        _signer { signer }, _auth_id { auth_id }, _priority_fee { priority_fee }
    {
    }

    uint32_t batch_builder::compute_unit_limit(const size_t num_deploys)
    {
        const uint64_t units = static_cast<uint64_t>(num_deploys) * units_per_deploy;
        return static_cast<uint32_t>(std::min(units, static_cast<uint64_t>(ledger::compute_budget::max_unit_limit)));
    }

    vector<intent_list> batch_builder::partition(const intent_list &to_deploy, const lookup_table_manager &luts) const
    {
        const auto ceiling = luts.capacity_ceiling();
        const bool shared_indexed = luts.usable() && luts.contains_all(ledger::shared_addresses::get().lookup_candidates());
        vector<intent_list> groups {};
        intent_list group {};
        bool group_indexed = shared_indexed;
        for (const auto &intent: to_deploy) {
            const bool member_indexed = shared_indexed && luts.contains_all(intent.dep.addrs.lookup_candidates(intent.dep.manager()));
            bool indexed = group_indexed && member_indexed;
            if (group.size() + 1 > (indexed ? ceiling : lookup_table_manager::unloaded_ceiling)) {
                groups.emplace_back(std::move(group));
                group = {};
                indexed = member_indexed;
            }
            group.emplace_back(intent);
            group_indexed = indexed;
        }
        if (!group.empty())
            groups.emplace_back(std::move(group));
        return groups;
    }

    void batch_builder::_add_checkpoint(ledger::instruction_list &ixs, const deploy_intent &intent) const
    {
        if (!intent.checkpoint_round)
            throw error(fmt::format("deployer {} owes no checkpoint", intent.dep.address));
        ixs.emplace_back(ledger::evore::mm_autocheckpoint(_signer, intent.dep.manager(), intent.dep.addrs, _auth_id, *intent.checkpoint_round));
        ixs.emplace_back(ledger::evore::recycle_sol(_signer, intent.dep.manager(), intent.dep.addrs, _auth_id));
    }

    batch batch_builder::deploy_batch(const intent_list &group, const uint64_t round_id) const
    {
        if (group.empty())
            throw error("a deploy batch must have at least one member");
        batch b {};
        b.instructions.emplace_back(ledger::compute_budget::set_unit_limit(compute_unit_limit(group.size())));
        b.instructions.emplace_back(ledger::compute_budget::set_unit_price(_priority_fee));
        for (const auto &intent: group) {
            if (intent.checkpoint_round) {
                _add_checkpoint(b.instructions, intent);
                b.checkpointed.emplace_back(intent.dep.address);
            }
            b.instructions.emplace_back(ledger::evore::mm_autodeploy(_signer, intent.dep.manager(), intent.dep.addrs, ledger::evore::autodeploy_params {
                .auth_id=_auth_id,
                .round_id=round_id,
                .amount=intent.amount_per_square,
                .squares_mask=intent.squares_mask,
                .expected_bps_fee=intent.dep.record.expected_bps_fee,
                .expected_flat_fee=intent.dep.record.expected_flat_fee
            }));
            b.deployers.emplace_back(intent.dep.address);
        }
        return b;
    }

    batch batch_builder::checkpoint_batch(const deploy_intent &intent) const
    {
        batch b { .checkpoint_only=true };
        b.instructions.emplace_back(ledger::compute_budget::set_unit_limit(checkpoint_only_units));
        b.instructions.emplace_back(ledger::compute_budget::set_unit_price(_priority_fee));
        _add_checkpoint(b.instructions, intent);
        b.checkpointed.emplace_back(intent.dep.address);
        return b;
    }

    batch_list batch_builder::build(const admission &adm, const lookup_table_manager &luts, const uint64_t round_id) const
    {
        batch_list batches {};
        for (const auto &intent: adm.to_checkpoint_only)
            batches.emplace_back(checkpoint_batch(intent));
        for (const auto &group: partition(adm.to_deploy, luts))
            batches.emplace_back(deploy_batch(group, round_id));
        return batches;
    }
}
