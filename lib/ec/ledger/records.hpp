/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_RECORDS_HPP
#define EVORE_CRANK_LEDGER_RECORDS_HPP

#include <array>
#include <limits>
#include <ec/ledger/types.hpp>

namespace evore_crank::ledger {
    static constexpr uint64_t board_end_unbounded = std::numeric_limits<uint64_t>::max();
    static constexpr size_t num_squares = 25;

    struct deployer_record {
        static constexpr uint64_t tag = 101;
        static constexpr size_t size = 112;
        static constexpr size_t manager_offset = 8;
        static constexpr size_t deploy_authority_offset = 40;
        static constexpr size_t bps_fee_offset = 72;
        static constexpr size_t flat_fee_offset = 80;
        static constexpr size_t expected_bps_fee_offset = 88;
        static constexpr size_t expected_flat_fee_offset = 96;
        static constexpr size_t max_per_round_offset = 104;

        pubkey manager {};
        pubkey deploy_authority {};
        uint64_t bps_fee = 0;
        uint64_t flat_fee = 0;
        uint64_t expected_bps_fee = 0;
        uint64_t expected_flat_fee = 0;
        uint64_t max_per_round = 0;

        static deployer_record decode(buffer data);
        uint8_vector encode() const;
    };

    struct board_record {
        static constexpr uint64_t tag = 105;
        static constexpr size_t size = 40;
        static constexpr size_t round_id_offset = 8;
        static constexpr size_t start_slot_offset = 16;
        static constexpr size_t end_slot_offset = 24;
        static constexpr size_t epoch_id_offset = 32;

        uint64_t round_id = 0;
        uint64_t start_slot = 0;
        uint64_t end_slot = 0;
        uint64_t epoch_id = 0;

        static board_record decode(buffer data);
        uint8_vector encode() const;
    };

    struct miner_record {
        static constexpr uint64_t tag = 103;
        static constexpr size_t size = 544;
        static constexpr size_t authority_offset = 8;
        static constexpr size_t deployed_offset = 40;
        static constexpr size_t cumulative_offset = 240;
        static constexpr size_t checkpoint_fee_offset = 440;
        static constexpr size_t checkpoint_id_offset = 448;
        static constexpr size_t rewards_sol_offset = 488;
        static constexpr size_t rewards_ore_offset = 496;
        static constexpr size_t round_id_offset = 512;

        pubkey authority {};
        std::array<uint64_t, num_squares> deployed {};
        std::array<uint64_t, num_squares> cumulative {};
        uint64_t checkpoint_fee = 0;
        uint64_t checkpoint_id = 0;
        uint64_t rewards_sol = 0;
        uint64_t rewards_ore = 0;
        uint64_t round_id = 0;

        static miner_record decode(buffer data);
        uint8_vector encode() const;

        // The miner took part in a round whose rewards have not been checkpointed yet.
        bool checkpoint_owed() const noexcept
        {
            return checkpoint_id < round_id;
        }
    };

    struct lookup_table_record {
        static constexpr uint32_t type_lookup_table = 1;
        static constexpr size_t type_offset = 0;
        static constexpr size_t deactivation_slot_offset = 4;
        static constexpr size_t last_extended_slot_offset = 12;
        static constexpr size_t last_extended_start_offset = 20;
        static constexpr size_t authority_tag_offset = 21;
        static constexpr size_t authority_offset = 22;
        static constexpr size_t addresses_offset = 56;
        static constexpr size_t max_addresses = 256;

        uint64_t deactivation_slot = std::numeric_limits<uint64_t>::max();
        uint64_t last_extended_slot = 0;
        uint8_t last_extended_start = 0;
        std::optional<pubkey> authority {};
        pubkey_list addresses {};

        static lookup_table_record decode(buffer data);
        uint8_vector encode() const;

        bool active() const noexcept
        {
            return deactivation_slot == std::numeric_limits<uint64_t>::max();
        }
    };
}

#endif // !EVORE_CRANK_LEDGER_RECORDS_HPP
