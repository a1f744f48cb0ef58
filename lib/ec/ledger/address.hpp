/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_ADDRESS_HPP
#define EVORE_CRANK_LEDGER_ADDRESS_HPP

#include <ec/ledger/types.hpp>

namespace evore_crank::ledger {
    namespace program {
        extern const pubkey &system();
        extern const pubkey &compute_budget();
        extern const pubkey &address_lookup_table();
        extern const pubkey &evore();
        extern const pubkey &ore();
        extern const pubkey &entropy();
        extern const pubkey &fee_collector();
        extern const pubkey &ore_treasury();
    }

    struct program_address {
        pubkey address {};
        uint8_t bump = 0;

        bool operator==(const program_address &o) const =default;
    };

    static constexpr std::string_view pda_marker { "ProgramDerivedAddress" };
    static constexpr size_t max_seed_len = 32;
    static constexpr size_t max_seeds = 16;

    // Searches bump seeds from 255 downward for the first candidate that is not an ed25519 curve point.
    extern program_address find_program_address(std::initializer_list<buffer> seeds, const pubkey &program_id);
    // Throws when the candidate for the given bump lies on the curve.
    extern pubkey create_program_address(std::initializer_list<buffer> seeds, uint8_t bump, const pubkey &program_id);

    struct deployer_addresses {
        program_address deployer {};
        program_address autodeploy_balance {};
        program_address managed_miner_auth {};
        program_address ore_miner {};
        program_address automation {};

        static deployer_addresses derive(const pubkey &manager, uint64_t auth_id);

        // All addresses an autodeploy of this deployer references besides the shared ones.
        pubkey_list lookup_candidates(const pubkey &manager) const;
    };

    struct shared_addresses {
        program_address board {};
        program_address config {};
        program_address treasury {};
        program_address entropy_var {};

        static const shared_addresses &get();

        static program_address round(uint64_t round_id);

        // Shared addresses worth indexing in a lookup table, including invoked programs that are never table-referenced.
        pubkey_list lookup_candidates() const;
    };
}

#endif // !EVORE_CRANK_LEDGER_ADDRESS_HPP
