/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/ledger/records.hpp>

namespace evore_crank::ledger {
    namespace {
        void check_layout(const buffer data, const uint64_t tag, const size_t min_size, const std::string_view name)
        {
            if (data.size() < min_size)
                throw decode_error(fmt::format("a {} record must have at least {} bytes but got {}", name, min_size, data.size()));
            if (const auto act_tag = data.read_le<uint64_t>(0); act_tag != tag)
                throw decode_error(fmt::format("a {} record must have tag {} but got {}", name, tag, act_tag));
        }

        pubkey read_key(const buffer data, const size_t offset)
        {
            return pubkey { data.subbuf(offset, sizeof(pubkey)) };
        }

        void write_le(uint8_vector &out, const size_t offset, const uint64_t val)
        {
            for (size_t i = 0; i < sizeof(val); ++i)
                out.at(offset + i) = static_cast<uint8_t>(val >> (8 * i));
        }

        void write_key(uint8_vector &out, const size_t offset, const pubkey &key)
        {
            if (offset + key.size() > out.size())
                throw error(fmt::format("a key at offset {} does not fit into {} bytes", offset, out.size()));
            std::copy(key.begin(), key.end(), out.begin() + static_cast<std::ptrdiff_t>(offset));
        }
    }

    deployer_record deployer_record::decode(const buffer data)
    {
        check_layout(data, tag, size, "deployer");
        return {
            .manager=read_key(data, manager_offset),
            .deploy_authority=read_key(data, deploy_authority_offset),
            .bps_fee=data.read_le<uint64_t>(bps_fee_offset),
            .flat_fee=data.read_le<uint64_t>(flat_fee_offset),
            .expected_bps_fee=data.read_le<uint64_t>(expected_bps_fee_offset),
            .expected_flat_fee=data.read_le<uint64_t>(expected_flat_fee_offset),
            .max_per_round=data.read_le<uint64_t>(max_per_round_offset)
        };
    }

    uint8_vector deployer_record::encode() const
    {
        uint8_vector out(size);
        write_le(out, 0, tag);
        write_key(out, manager_offset, manager);
        write_key(out, deploy_authority_offset, deploy_authority);
        write_le(out, bps_fee_offset, bps_fee);
        write_le(out, flat_fee_offset, flat_fee);
        write_le(out, expected_bps_fee_offset, expected_bps_fee);
        write_le(out, expected_flat_fee_offset, expected_flat_fee);
        write_le(out, max_per_round_offset, max_per_round);
        return out;
    }

    board_record board_record::decode(const buffer data)
    {
        check_layout(data, tag, size, "board");
        board_record res {
            .round_id=data.read_le<uint64_t>(round_id_offset),
            .start_slot=data.read_le<uint64_t>(start_slot_offset),
            .end_slot=data.read_le<uint64_t>(end_slot_offset),
            .epoch_id=data.read_le<uint64_t>(epoch_id_offset)
        };
        if (res.end_slot != board_end_unbounded && res.end_slot < res.start_slot)
            throw decode_error(fmt::format("a board's end slot {} precedes its start slot {}", res.end_slot, res.start_slot));
        return res;
    }

    uint8_vector board_record::encode() const
    {
        uint8_vector out(size);
        write_le(out, 0, tag);
        write_le(out, round_id_offset, round_id);
        write_le(out, start_slot_offset, start_slot);
        write_le(out, end_slot_offset, end_slot);
        write_le(out, epoch_id_offset, epoch_id);
        return out;
    }

    miner_record miner_record::decode(const buffer data)
    {
        check_layout(data, tag, size, "miner");
        miner_record res {};
        res.authority = read_key(data, authority_offset);
        for (size_t i = 0; i < num_squares; ++i) {
            res.deployed[i] = data.read_le<uint64_t>(deployed_offset + i * sizeof(uint64_t));
            res.cumulative[i] = data.read_le<uint64_t>(cumulative_offset + i * sizeof(uint64_t));
        }
        res.checkpoint_fee = data.read_le<uint64_t>(checkpoint_fee_offset);
        res.checkpoint_id = data.read_le<uint64_t>(checkpoint_id_offset);
        res.rewards_sol = data.read_le<uint64_t>(rewards_sol_offset);
        res.rewards_ore = data.read_le<uint64_t>(rewards_ore_offset);
        res.round_id = data.read_le<uint64_t>(round_id_offset);
        return res;
    }

    uint8_vector miner_record::encode() const
    {
        uint8_vector out(size);
        write_le(out, 0, tag);
        write_key(out, authority_offset, authority);
        for (size_t i = 0; i < num_squares; ++i) {
            write_le(out, deployed_offset + i * sizeof(uint64_t), deployed[i]);
            write_le(out, cumulative_offset + i * sizeof(uint64_t), cumulative[i]);
        }
        write_le(out, checkpoint_fee_offset, checkpoint_fee);
        write_le(out, checkpoint_id_offset, checkpoint_id);
        write_le(out, rewards_sol_offset, rewards_sol);
        write_le(out, rewards_ore_offset, rewards_ore);
        write_le(out, round_id_offset, round_id);
        return out;
    }

    lookup_table_record lookup_table_record::decode(const buffer data)
    {
        if (data.size() < addresses_offset)
            throw decode_error(fmt::format("a lookup table record must have at least {} bytes but got {}", addresses_offset, data.size()));
        if (const auto typ = data.read_le<uint32_t>(type_offset); typ != type_lookup_table)
            throw decode_error(fmt::format("a lookup table record must have type {} but got {}", type_lookup_table, typ));
        const auto addr_bytes = data.size() - addresses_offset;
        if (addr_bytes % sizeof(pubkey) != 0)
            throw decode_error(fmt::format("a lookup table's address area of {} bytes is not a multiple of {}", addr_bytes, sizeof(pubkey)));
        lookup_table_record res {};
        res.deactivation_slot = data.read_le<uint64_t>(deactivation_slot_offset);
        res.last_extended_slot = data.read_le<uint64_t>(last_extended_slot_offset);
        res.last_extended_start = data[last_extended_start_offset];
        switch (const auto auth_tag = data[authority_tag_offset]; auth_tag) {
            case 0: break;
            case 1: res.authority = read_key(data, authority_offset); break;
            default: throw decode_error(fmt::format("unsupported lookup table authority tag: {}", auth_tag));
        }
        res.addresses.reserve(addr_bytes / sizeof(pubkey));
        for (size_t off = addresses_offset; off < data.size(); off += sizeof(pubkey))
            res.addresses.emplace_back(read_key(data, off));
        return res;
    }

    uint8_vector lookup_table_record::encode() const
    {
        if (addresses.size() > max_addresses)
            throw error(fmt::format("a lookup table holds at most {} addresses but got {}", max_addresses, addresses.size()));
        uint8_vector out(addresses_offset + addresses.size() * sizeof(pubkey));
        for (size_t i = 0; i < sizeof(uint32_t); ++i)
            out[type_offset + i] = static_cast<uint8_t>(type_lookup_table >> (8 * i));
        write_le(out, deactivation_slot_offset, deactivation_slot);
        write_le(out, last_extended_slot_offset, last_extended_slot);
        out[last_extended_start_offset] = last_extended_start;
        if (authority) {
            out[authority_tag_offset] = 1;
            write_key(out, authority_offset, *authority);
        }
        for (size_t i = 0; i < addresses.size(); ++i)
            write_key(out, addresses_offset + i * sizeof(pubkey), addresses[i]);
        return out;
    }
}
