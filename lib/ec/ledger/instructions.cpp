/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/ledger/instructions.hpp>

namespace evore_crank::ledger {
    namespace {
        account_meta writable(const pubkey &key, const bool is_signer=false)
        {
            return { key, is_signer, true };
        }

        account_meta readonly(const pubkey &key, const bool is_signer=false)
        {
            return { key, is_signer, false };
        }
    }

    namespace compute_budget {
        instruction set_unit_limit(const uint32_t units)
        {
            if (units > max_unit_limit)
                throw error(fmt::format("a compute unit limit must not exceed {} but got {}", max_unit_limit, units));
            instruction ix { .program_id=program::compute_budget() };
            ix.data << uint8_t { 2 };
            append_le(ix.data, units);
            return ix;
        }

        instruction set_unit_price(const uint64_t micro_lamports)
        {
            instruction ix { .program_id=program::compute_budget() };
            ix.data << uint8_t { 3 };
            append_le(ix.data, micro_lamports);
            return ix;
        }
    }

    namespace system_program {
        instruction transfer(const pubkey &from, const pubkey &to, const uint64_t lamports)
        {
            instruction ix { .program_id=program::system(), .accounts={ writable(from, true), writable(to) } };
            append_le(ix.data, uint32_t { 2 });
            append_le(ix.data, lamports);
            return ix;
        }
    }

    namespace lookup_table_program {
        static constexpr size_t max_extend_addresses = 30;

        create_result create(const pubkey &authority, const pubkey &payer, const uint64_t recent_slot)
        {
            uint8_vector slot_le {};
            append_le(slot_le, recent_slot);
            create_result res {};
            res.table = find_program_address({ authority, slot_le }, program::address_lookup_table());
            res.ix.program_id = program::address_lookup_table();
            res.ix.accounts = { writable(res.table.address), readonly(authority, true), writable(payer, true), readonly(program::system()) };
            append_le(res.ix.data, uint32_t { 0 });
            append_le(res.ix.data, recent_slot);
            res.ix.data << res.table.bump;
            return res;
        }

        instruction extend(const pubkey &table, const pubkey &authority, const pubkey &payer, const pubkey_list &addresses)
        {
            if (addresses.empty() || addresses.size() > max_extend_addresses)
                throw error(fmt::format("a lookup table extension must carry from 1 to {} addresses but got {}", max_extend_addresses, addresses.size()));
            instruction ix {
                .program_id=program::address_lookup_table(),
                .accounts={ writable(table), readonly(authority, true), writable(payer, true), readonly(program::system()) }
            };
            append_le(ix.data, uint32_t { 2 });
            append_le(ix.data, static_cast<uint64_t>(addresses.size()));
            for (const auto &addr: addresses)
                ix.data << addr;
            return ix;
        }

        instruction deactivate(const pubkey &table, const pubkey &authority)
        {
            instruction ix { .program_id=program::address_lookup_table(), .accounts={ writable(table), readonly(authority, true) } };
            append_le(ix.data, uint32_t { 3 });
            return ix;
        }

        instruction close(const pubkey &table, const pubkey &authority, const pubkey &recipient)
        {
            instruction ix {
                .program_id=program::address_lookup_table(),
                .accounts={ writable(table), readonly(authority, true), writable(recipient) }
            };
            append_le(ix.data, uint32_t { 4 });
            return ix;
        }
    }

    namespace evore {
        instruction mm_autodeploy(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, const autodeploy_params &params)
        {
            const auto &shared = shared_addresses::get();
            const auto round = shared_addresses::round(params.round_id);
            instruction ix {
                .program_id=program::evore(),
                .accounts={
                    writable(signer, true),
                    writable(manager),
                    writable(addrs.deployer.address),
                    writable(addrs.autodeploy_balance.address),
                    writable(addrs.managed_miner_auth.address),
                    writable(addrs.ore_miner.address),
                    writable(program::fee_collector()),
                    writable(addrs.automation.address),
                    writable(shared.config.address),
                    writable(shared.board.address),
                    writable(round.address),
                    writable(shared.entropy_var.address),
                    readonly(program::ore()),
                    readonly(program::entropy()),
                    readonly(program::system())
                }
            };
            auto &d = ix.data;
            d << ix_mm_autodeploy;
            append_le(d, params.auth_id);
            d << addrs.managed_miner_auth.bump << addrs.deployer.bump << addrs.autodeploy_balance.bump;
            // padding to the 8-byte alignment of the amount
            d << uint8_t { 0 } << uint8_t { 0 } << uint8_t { 0 } << uint8_t { 0 } << uint8_t { 0 };
            append_le(d, params.amount);
            append_le(d, params.squares_mask);
            append_le(d, uint32_t { 0 });
            append_le(d, params.expected_bps_fee);
            append_le(d, params.expected_flat_fee);
            if (d.size() != autodeploy_data_size)
                throw error(fmt::format("internal error: autodeploy data must have {} bytes but has {}", autodeploy_data_size, d.size()));
            return ix;
        }

        instruction mm_autocheckpoint(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, const uint64_t auth_id, const uint64_t checkpoint_round)
        {
            const auto &shared = shared_addresses::get();
            instruction ix {
                .program_id=program::evore(),
                .accounts={
                    writable(signer, true),
                    writable(manager),
                    writable(addrs.deployer.address),
                    writable(addrs.managed_miner_auth.address),
                    writable(addrs.ore_miner.address),
                    writable(program::ore_treasury()),
                    writable(shared.board.address),
                    writable(shared_addresses::round(checkpoint_round).address),
                    readonly(program::system()),
                    readonly(program::ore())
                }
            };
            ix.data << ix_mm_autocheckpoint;
            append_le(ix.data, auth_id);
            ix.data << addrs.managed_miner_auth.bump;
            return ix;
        }

        instruction recycle_sol(const pubkey &signer, const pubkey &manager, const deployer_addresses &addrs, const uint64_t auth_id)
        {
            instruction ix {
                .program_id=program::evore(),
                .accounts={
                    writable(signer, true),
                    writable(manager),
                    writable(addrs.deployer.address),
                    writable(addrs.autodeploy_balance.address),
                    writable(addrs.managed_miner_auth.address),
                    writable(addrs.ore_miner.address),
                    readonly(program::ore()),
                    readonly(program::system())
                }
            };
            ix.data << ix_recycle_sol;
            append_le(ix.data, auth_id);
            ix.data << addrs.managed_miner_auth.bump;
            return ix;
        }
    }
}
