/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_INSTRUCTIONS_HPP
#define EVORE_CRANK_LEDGER_INSTRUCTIONS_HPP

#include <ec/ledger/address.hpp>

namespace evore_crank::ledger {
    namespace compute_budget {
        static constexpr uint32_t max_unit_limit = 1'400'000;

        extern instruction set_unit_limit(uint32_t units);
        extern instruction set_unit_price(uint64_t micro_lamports);
    }

    namespace system_program {
        extern instruction transfer(const pubkey &from, const pubkey &to, uint64_t lamports);
    }

    namespace lookup_table_program {
        struct create_result {
            instruction ix {};
            program_address table {};
        };

        extern create_result create(const pubkey &authority, const pubkey &payer, uint64_t recent_slot);
        extern instruction extend(const pubkey &table, const pubkey &authority, const pubkey &payer, const pubkey_list &addresses);
        extern instruction deactivate(const pubkey &table, const pubkey &authority);
        extern instruction close(const pubkey &table, const pubkey &authority, const pubkey &recipient);
    }

    namespace evore {
        static constexpr uint8_t ix_recycle_sol = 9;
        static constexpr uint8_t ix_mm_autodeploy = 7;
        static constexpr uint8_t ix_mm_autocheckpoint = 11;
        static constexpr size_t autodeploy_data_size = 49;

        struct autodeploy_params {
            uint64_t auth_id = 0;
            uint64_t round_id = 0;
            uint64_t amount = 0;
            uint32_t squares_mask = 0;
            uint64_t expected_bps_fee = 0;
            uint64_t expected_flat_fee = 0;
        };

        extern instruction mm_autodeploy(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, const autodeploy_params &params);
        extern instruction mm_autocheckpoint(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, uint64_t auth_id, uint64_t checkpoint_round);
        extern instruction recycle_sol(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, uint64_t auth_id);
    }
}

#endif // !EVORE_CRANK_LEDGER_INSTRUCTIONS_HPP
