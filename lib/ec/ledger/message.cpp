/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/ledger/message.hpp>

namespace evore_crank::ledger {
    namespace shortvec {
        void encode(uint8_vector &out, size_t val)
        {
            if (val > max_value)
                throw error(fmt::format("a compact-u16 value must not exceed {} but got {}", max_value, val));
            for (;;) {
                auto b = static_cast<uint8_t>(val & 0x7F);
                val >>= 7;
                if (val == 0) {
                    out << b;
                    break;
                }
                out << static_cast<uint8_t>(b | 0x80);
            }
        }

        size_t decode(const buffer data, size_t &offset)
        {
            size_t val = 0;
            for (size_t i = 0; i < 3; ++i) {
                if (offset >= data.size())
                    throw decode_error("a compact-u16 value ends prematurely");
                const auto b = data[offset++];
                val |= static_cast<size_t>(b & 0x7F) << (7 * i);
                if ((b & 0x80) == 0) {
                    if (val > max_value)
                        throw decode_error(fmt::format("a compact-u16 value exceeds {}: {}", max_value, val));
                    return val;
                }
            }
            throw decode_error("a compact-u16 value is longer than three bytes");
        }
    }

    namespace {
        struct key_meta {
            bool is_signer = false;
            bool is_writable = false;
            bool is_invoked = false;
        };

        struct compiled_keys {
            vector<pubkey> order {};
            map<pubkey, key_meta> metas {};

            key_meta &add(const pubkey &key)
            {
                const auto [it, created] = metas.try_emplace(key);
                if (created)
                    order.emplace_back(key);
                return it->second;
            }
        };

        uint8_t account_index(const flat_map<pubkey, size_t> &index, const pubkey &key)
        {
            const auto it = index.find(key);
            if (it == index.end())
                throw error(fmt::format("an instruction references an uncompiled account: {}", key));
            return static_cast<uint8_t>(it->second);
        }

        template<typename T>
        void append_compact(uint8_vector &out, const vector<T> &items)
        {
            shortvec::encode(out, items.size());
            for (const auto &i: items)
                out << static_cast<uint8_t>(i);
        }

        buffer read_bytes(const buffer data, size_t &offset, const size_t sz)
        {
            if (offset + sz > data.size())
                throw decode_error(fmt::format("a message of {} bytes ends before offset {}", data.size(), offset + sz));
            const auto res = data.subbuf(offset, sz);
            offset += sz;
            return res;
        }

        vector<uint8_t> read_compact_u8(const buffer data, size_t &offset)
        {
            const auto sz = shortvec::decode(data, offset);
            const auto bytes = read_bytes(data, offset, sz);
            return { bytes.begin(), bytes.end() };
        }
    }

    message_v0 message_v0::compile(const pubkey &payer, const instruction_list &ixs, const blockhash &recent_blockhash,
        const address_table_list &tables)
    {
        compiled_keys keys {};
        {
            auto &payer_meta = keys.add(payer);
            payer_meta.is_signer = true;
            payer_meta.is_writable = true;
        }
        for (const auto &ix: ixs) {
            keys.add(ix.program_id).is_invoked = true;
            for (const auto &acc: ix.accounts) {
                auto &meta = keys.add(acc.key);
                meta.is_signer |= acc.is_signer;
                meta.is_writable |= acc.is_writable;
            }
        }

        message_v0 msg {};
        msg.recent_blockhash = recent_blockhash;
        pubkey_list writable_signers {}, readonly_signers {}, writable_other {}, readonly_other {};
        for (const auto &key: keys.order) {
            const auto &meta = keys.metas.at(key);
            if (meta.is_signer)
                (meta.is_writable ? writable_signers : readonly_signers).emplace_back(key);
            else
                (meta.is_writable ? writable_other : readonly_other).emplace_back(key);
        }

        pubkey_list lookup_writable {}, lookup_readonly {};
        for (const auto &table: tables) {
            table_lookup lk { .table=table.address };
            const auto extract = [&](pubkey_list &candidates, vector<uint8_t> &indices, pubkey_list &looked_up) {
                for (auto it = candidates.begin(); it != candidates.end(); ) {
                    if (keys.metas.at(*it).is_invoked) {
                        ++it;
                        continue;
                    }
                    const auto pos = std::find(table.addresses.begin(), table.addresses.end(), *it);
                    if (pos == table.addresses.end() || pos - table.addresses.begin() > 255) {
                        ++it;
                        continue;
                    }
                    indices.emplace_back(static_cast<uint8_t>(pos - table.addresses.begin()));
                    looked_up.emplace_back(*it);
                    it = candidates.erase(it);
                }
            };
            extract(writable_other, lk.writable, lookup_writable);
            extract(readonly_other, lk.readonly, lookup_readonly);
            if (!lk.writable.empty() || !lk.readonly.empty())
                msg.lookups.emplace_back(std::move(lk));
        }

        for (const auto *group: { &writable_signers, &readonly_signers, &writable_other, &readonly_other })
            msg.static_keys.insert(msg.static_keys.end(), group->begin(), group->end());
        const auto num_signers = writable_signers.size() + readonly_signers.size();
        const auto total_keys = msg.static_keys.size() + lookup_writable.size() + lookup_readonly.size();
        if (total_keys > 256)
            throw error(fmt::format("a message can reference at most 256 accounts but needs {}", total_keys));
        msg.header.num_required_signatures = static_cast<uint8_t>(num_signers);
        msg.header.num_readonly_signed = static_cast<uint8_t>(readonly_signers.size());
        msg.header.num_readonly_unsigned = static_cast<uint8_t>(readonly_other.size());

        flat_map<pubkey, size_t> index {};
        for (const auto *group: { &msg.static_keys, &lookup_writable, &lookup_readonly }) {
            for (const auto &key: *group)
                index.emplace(key, index.size());
        }
        for (const auto &ix: ixs) {
            compiled_instruction cix { .program_idx=account_index(index, ix.program_id), .data=ix.data };
            for (const auto &acc: ix.accounts)
                cix.accounts.emplace_back(account_index(index, acc.key));
            msg.instructions.emplace_back(std::move(cix));
        }
        return msg;
    }

    message_v0 message_v0::deserialize(const buffer data)
    {
        size_t off = 0;
        if (read_bytes(data, off, 1)[0] != version_prefix)
            throw decode_error("only version 0 messages are supported");
        message_v0 msg {};
        const auto hdr = read_bytes(data, off, 3);
        msg.header = { hdr[0], hdr[1], hdr[2] };
        const auto num_keys = shortvec::decode(data, off);
        for (size_t i = 0; i < num_keys; ++i)
            msg.static_keys.emplace_back(read_bytes(data, off, sizeof(pubkey)));
        msg.recent_blockhash = read_bytes(data, off, sizeof(blockhash));
        const auto num_ixs = shortvec::decode(data, off);
        for (size_t i = 0; i < num_ixs; ++i) {
            compiled_instruction cix {};
            cix.program_idx = read_bytes(data, off, 1)[0];
            cix.accounts = read_compact_u8(data, off);
            const auto data_sz = shortvec::decode(data, off);
            cix.data = read_bytes(data, off, data_sz);
            msg.instructions.emplace_back(std::move(cix));
        }
        const auto num_lookups = shortvec::decode(data, off);
        for (size_t i = 0; i < num_lookups; ++i) {
            table_lookup lk {};
            lk.table = read_bytes(data, off, sizeof(pubkey));
            lk.writable = read_compact_u8(data, off);
            lk.readonly = read_compact_u8(data, off);
            msg.lookups.emplace_back(std::move(lk));
        }
        if (off != data.size())
            throw decode_error(fmt::format("a message has {} trailing bytes", data.size() - off));
        return msg;
    }

    uint8_vector message_v0::serialize() const
    {
        uint8_vector out {};
        out << version_prefix;
        out << header.num_required_signatures << header.num_readonly_signed << header.num_readonly_unsigned;
        shortvec::encode(out, static_keys.size());
        for (const auto &key: static_keys)
            out << key;
        out << recent_blockhash;
        shortvec::encode(out, instructions.size());
        for (const auto &ix: instructions) {
            out << ix.program_idx;
            append_compact(out, ix.accounts);
            shortvec::encode(out, ix.data.size());
            out << ix.data;
        }
        shortvec::encode(out, lookups.size());
        for (const auto &lk: lookups) {
            out << lk.table;
            append_compact(out, lk.writable);
            append_compact(out, lk.readonly);
        }
        return out;
    }

    size_t message_v0::num_lookup_accounts() const
    {
        size_t num = 0;
        for (const auto &lk: lookups)
            num += lk.writable.size() + lk.readonly.size();
        return num;
    }

    transaction transaction::sign(message_v0 &&msg, const keypair &kp)
    {
        if (msg.header.num_required_signatures != 1)
            throw error(fmt::format("only single-signer messages are supported but {} signatures are required", msg.header.num_required_signatures));
        if (msg.static_keys.empty() || msg.static_keys.front() != kp.public_key)
            throw error("the fee payer of the message does not match the signing key");
        transaction tx {};
        tx.signatures.emplace_back(ed25519::sign(msg.serialize(), kp.secret));
        tx.message = std::move(msg);
        return tx;
    }

    uint8_vector transaction::serialize() const
    {
        uint8_vector out {};
        shortvec::encode(out, signatures.size());
        for (const auto &sig: signatures)
            out << sig;
        out << message.serialize();
        return out;
    }
}
