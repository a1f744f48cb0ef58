/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_READER_MOCK_HPP
#define EVORE_CRANK_LEDGER_READER_MOCK_HPP

#include <functional>
#include <ec/ed25519.hpp>
#include <ec/ledger/address.hpp>
#include <ec/ledger/message.hpp>
#include <ec/ledger/reader.hpp>
#include <ec/ledger/records.hpp>

namespace evore_crank::ledger {
    inline keypair mock_keypair(const uint8_t seed_byte)
    {
        ed25519::seed seed {};
        seed.fill(seed_byte);
        const auto [sk, vk] = ed25519::create_from_seed(seed);
        return { sk, pubkey { vk } };
    }

    inline pubkey mock_address(const uint8_t fill)
    {
        pubkey addr {};
        addr.fill(fill);
        return addr;
    }

    // Deterministic in-memory ledger for tests.
    struct reader_mock: reader {
        using submit_observer = std::function<void(const buffer &tx_bytes)>;

        uint64_t slot = 0;
        uint64_t block_height = 1000;
        blockhash recent_blockhash { blockhash::from_hex("0101010101010101010101010101010101010101010101010101010101010101") };
        map<pubkey, account_info> accounts {};
        vector<uint8_vector> submitted {};
        map<signature, confirmation_status> statuses {};
        confirmation_status default_status = confirmation_status::confirmed;
        std::optional<submit_observer> on_submit {};
        // Makes every call fail as if the ledger was down.
        bool unavailable = false;
        // Number of upcoming submissions to refuse.
        size_t reject_submits = 0;
        size_t num_account_requests = 0;
        // Applies submitted address lookup table instructions to the accounts.
        bool simulate_lookup_tables = false;

        void set_account(const pubkey &addr, const buffer data, const uint64_t lamports=0, const pubkey &owner={})
        {
            accounts.insert_or_assign(addr, account_info { lamports, owner, uint8_vector { data } });
        }

        void set_balance(const pubkey &addr, const uint64_t lamports)
        {
            accounts[addr].lamports = lamports;
        }

        void set_board(const uint64_t round_id, const uint64_t start_slot, const uint64_t end_slot)
        {
            const board_record board { .round_id=round_id, .start_slot=start_slot, .end_slot=end_slot };
            set_account(shared_addresses::get().board.address, board.encode(), 0, program::ore());
        }

        // Returns the address of the deployer account.
        pubkey add_deployer(const deployer_record &rec, const uint64_t auth_id=0)
        {
            const auto addrs = deployer_addresses::derive(rec.manager, auth_id);
            set_account(addrs.deployer.address, rec.encode(), 1'000'000, program::evore());
            return addrs.deployer.address;
        }
    private:
        void _check_available() const
        {
            if (unavailable)
                throw ledger_unavailable("the mock ledger is configured as unavailable");
        }

        uint64_t _get_slot_impl() override
        {
            _check_available();
            return slot;
        }

        optional_account _get_account_impl(const pubkey &addr) override
        {
            _check_available();
            ++num_account_requests;
            if (const auto it = accounts.find(addr); it != accounts.end())
                return it->second;
            return {};
        }

        vector<optional_account> _get_accounts_impl(const pubkey_list &addrs) override
        {
            _check_available();
            ++num_account_requests;
            vector<optional_account> res {};
            for (const auto &addr: addrs) {
                if (const auto it = accounts.find(addr); it != accounts.end())
                    res.emplace_back(it->second);
                else
                    res.emplace_back();
            }
            return res;
        }

        vector<keyed_account> _get_program_accounts_impl(const pubkey &program, const filter_list &filters) override
        {
            _check_available();
            vector<keyed_account> res {};
            for (const auto &[addr, acc]: accounts) {
                if (acc.owner != program)
                    continue;
                bool match = true;
                for (const auto &f: filters) {
                    if (f.offset + f.bytes.size() > acc.data.size()
                            || static_cast<buffer>(acc.data).subbuf(f.offset, f.bytes.size()) != static_cast<buffer>(f.bytes)) {
                        match = false;
                        break;
                    }
                }
                if (match)
                    res.emplace_back(keyed_account { addr, acc });
            }
            return res;
        }

        blockhash_info _latest_blockhash_impl() override
        {
            _check_available();
            return { recent_blockhash, block_height + 150 };
        }

        signature _submit_transaction_impl(const buffer &tx_bytes) override
        {
            _check_available();
            if (reject_submits > 0) {
                --reject_submits;
                throw submit_rejected("the mock ledger refused the transaction");
            }
            // a single-signer transaction starts with a one-byte count followed by the signature
            if (tx_bytes.size() < 1 + sizeof(signature) || tx_bytes[0] == 0)
                throw submit_rejected(fmt::format("a transaction of {} bytes carries no signature", tx_bytes.size()));
            signature sig { tx_bytes.subbuf(1, sizeof(signature)) };
            submitted.emplace_back(tx_bytes);
            if (simulate_lookup_tables)
                _apply_lookup_table_program(tx_bytes);
            if (on_submit)
                (*on_submit)(tx_bytes);
            return sig;
        }

        void _apply_lookup_table_program(const buffer tx_bytes)
        {
            size_t off = 0;
            const auto num_sigs = shortvec::decode(tx_bytes, off);
            const auto msg = message_v0::deserialize(tx_bytes.subbuf(off + num_sigs * sizeof(signature)));
            for (const auto &ix: msg.instructions) {
                if (msg.static_keys.at(ix.program_idx) != program::address_lookup_table())
                    continue;
                const buffer data = ix.data;
                const auto &table = msg.static_keys.at(ix.accounts.at(0));
                switch (data.read_le<uint32_t>(0)) {
                    case 0: {
                        const lookup_table_record rec { .authority=msg.static_keys.at(ix.accounts.at(1)) };
                        set_account(table, rec.encode(), 1'000'000, program::address_lookup_table());
                        break;
                    }
                    case 2: {
                        auto rec = lookup_table_record::decode(accounts.at(table).data);
                        const auto num_addrs = data.read_le<uint64_t>(4);
                        for (size_t i = 0; i < num_addrs; ++i)
                            rec.addresses.emplace_back(pubkey { data.subbuf(12 + i * sizeof(pubkey), sizeof(pubkey)) });
                        rec.last_extended_slot = slot;
                        accounts.at(table).data = rec.encode();
                        break;
                    }
                    case 3: {
                        auto rec = lookup_table_record::decode(accounts.at(table).data);
                        rec.deactivation_slot = slot;
                        accounts.at(table).data = rec.encode();
                        break;
                    }
                    case 4:
                        accounts.erase(table);
                        break;
                    default:
                        throw submit_rejected(fmt::format("unsupported lookup table instruction: {}", data.read_le<uint32_t>(0)));
                }
            }
        }

        confirmation_status _confirm_transaction_impl(const signature &sig) override
        {
            _check_available();
            if (const auto it = statuses.find(sig); it != statuses.end())
                return it->second;
            return default_status;
        }
    };
}

#endif // !EVORE_CRANK_LEDGER_READER_MOCK_HPP
