/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/ledger/address.hpp>
#include <ec/sha2.hpp>

namespace evore_crank::ledger {
    namespace program {
        const pubkey &system()
        {
            static const pubkey id {};
            return id;
        }

        const pubkey &compute_budget()
        {
            static const auto id = pubkey::from_base58("ComputeBudget111111111111111111111111111111");
            return id;
        }

        const pubkey &address_lookup_table()
        {
            static const auto id = pubkey::from_base58("AddressLookupTab1e1111111111111111111111111");
            return id;
        }

        const pubkey &evore()
        {
            static const auto id = pubkey::from_base58("8jaLKWLJAj5jVCZbxpe3zRUvLB3LD48MRtaQ2AjfCfxa");
            return id;
        }

        const pubkey &ore()
        {
            static const auto id = pubkey::from_base58("oreV3EG1i9BEgiAJ8b177Z2S2rMarzak4NMv1kULvWv");
            return id;
        }

        const pubkey &entropy()
        {
            static const auto id = pubkey::from_base58("3jSkUuYBoJzQPMEzTvkDFXCZUBksPamrVhrnHR9igu2X");
            return id;
        }

        const pubkey &fee_collector()
        {
            static const auto id = pubkey::from_base58("56qSi79jWdM1zie17NKFvdsh213wPb15HHUqGUjmJ2Lr");
            return id;
        }

        const pubkey &ore_treasury()
        {
            static const auto id = pubkey::from_base58("45db2FSR4mcXdSVVZbKbwojU6uYDpMyhpEi7cC8nHaWG");
            return id;
        }
    }

    static void validate_seeds(const std::initializer_list<buffer> seeds)
    {
        if (seeds.size() >= max_seeds)
            throw error(fmt::format("a program address allows at most {} seeds but got {}", max_seeds - 1, seeds.size()));
        for (const auto &s: seeds) {
            if (s.size() > max_seed_len)
                throw error(fmt::format("a program address seed must be at most {} bytes but got {}", max_seed_len, s.size()));
        }
    }

    static pubkey candidate_address(const std::initializer_list<buffer> seeds, const uint8_t bump, const pubkey &program_id)
    {
        uint8_vector pre {};
        for (const auto &s: seeds)
            pre << s;
        pre << bump;
        return pubkey { sha2::digest({ pre, program_id, pda_marker }) };
    }

    pubkey create_program_address(const std::initializer_list<buffer> seeds, const uint8_t bump, const pubkey &program_id)
    {
        validate_seeds(seeds);
        auto addr = candidate_address(seeds, bump, program_id);
        if (ed25519::is_on_curve(addr))
            throw error(fmt::format("the program address for bump {} lies on the ed25519 curve", bump));
        return addr;
    }

    program_address find_program_address(const std::initializer_list<buffer> seeds, const pubkey &program_id)
    {
        validate_seeds(seeds);
        for (int bump = 255; bump >= 0; --bump) {
            auto addr = candidate_address(seeds, static_cast<uint8_t>(bump), program_id);
            if (!ed25519::is_on_curve(addr))
                return { std::move(addr), static_cast<uint8_t>(bump) };
        }
        throw error(fmt::format("unable to find a viable program address for program {}", program_id));
    }

    static uint8_vector u64_seed(const uint64_t val)
    {
        uint8_vector res {};
        append_le(res, val);
        return res;
    }

    deployer_addresses deployer_addresses::derive(const pubkey &manager, const uint64_t auth_id)
    {
        deployer_addresses res {};
        res.deployer = find_program_address({ std::string_view { "deployer" }, manager }, program::evore());
        res.autodeploy_balance = find_program_address({ std::string_view { "autodeploy-balance" }, res.deployer.address }, program::evore());
        const auto auth_id_le = u64_seed(auth_id);
        res.managed_miner_auth = find_program_address({ std::string_view { "managed-miner-auth" }, manager, auth_id_le }, program::evore());
        res.ore_miner = find_program_address({ std::string_view { "miner" }, res.managed_miner_auth.address }, program::ore());
        res.automation = find_program_address({ std::string_view { "automation" }, res.managed_miner_auth.address }, program::ore());
        return res;
    }

    pubkey_list deployer_addresses::lookup_candidates(const pubkey &manager) const
    {
        return { manager, deployer.address, autodeploy_balance.address, managed_miner_auth.address, ore_miner.address, automation.address };
    }

    const shared_addresses &shared_addresses::get()
    {
        static const shared_addresses addrs = [] {
            shared_addresses res {};
            res.board = find_program_address({ std::string_view { "board" } }, program::ore());
            res.config = find_program_address({ std::string_view { "config" } }, program::ore());
            res.treasury = find_program_address({ std::string_view { "treasury" } }, program::ore());
            const auto zero_le = u64_seed(0);
            res.entropy_var = find_program_address({ std::string_view { "var" }, res.board.address, zero_le }, program::entropy());
            return res;
        }();
        return addrs;
    }

    program_address shared_addresses::round(const uint64_t round_id)
    {
        const auto id_le = u64_seed(round_id);
        return find_program_address({ std::string_view { "round" }, id_le }, program::ore());
    }

    pubkey_list shared_addresses::lookup_candidates() const
    {
        return {
            board.address, config.address, treasury.address, entropy_var.address,
            program::fee_collector(), program::ore_treasury(), program::system(),
            program::ore(), program::entropy(), program::evore(), program::compute_budget()
        };
    }
}
