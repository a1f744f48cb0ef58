/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_BATCH_BUILDER_HPP
#define EVORE_CRANK_CRANK_BATCH_BUILDER_HPP

#include <ec/crank/admission-controller.hpp>
#include <ec/crank/lookup-table-manager.hpp>

namespace evore_crank::crank {
    struct batch {
        // deployers whose deploy instruction the batch carries
        ledger::pubkey_list deployers {};
        // deployers served by a checkpoint-only batch
        ledger::pubkey_list checkpointed {};
        ledger::instruction_list instructions {};
        bool checkpoint_only = false;
    };
    using batch_list = vector<batch>;

    struct batch_builder {
        static constexpr uint32_t units_per_deploy = 400'000;
        static constexpr uint32_t checkpoint_only_units = 200'000;

        batch_builder(const ledger::pubkey &signer, uint64_t auth_id, uint64_t priority_fee);

        static uint32_t compute_unit_limit(size_t num_deploys);

        // Consecutive groups that use the loaded ceiling only while every member's addresses and the shared ones are indexed.
        [[nodiscard]] vector<intent_list> partition(const intent_list &to_deploy, const lookup_table_manager &luts) const;
        [[nodiscard]] batch_list build(const admission &adm, const lookup_table_manager &luts, uint64_t round_id) const;

        [[nodiscard]] batch deploy_batch(const intent_list &group, uint64_t round_id) const;
        [[nodiscard]] batch checkpoint_batch(const deploy_intent &intent) const;
    private:
        const ledger::pubkey _signer;
        const uint64_t _auth_id;
        const uint64_t _priority_fee;

        void _add_checkpoint(ledger::instruction_list &ixs, const deploy_intent &intent) const;
    };
}

#endif // !EVORE_CRANK_CRANK_BATCH_BUILDER_HPP
