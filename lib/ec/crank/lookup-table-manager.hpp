/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_LOOKUP_TABLE_MANAGER_HPP
#define EVORE_CRANK_CRANK_LOOKUP_TABLE_MANAGER_HPP

#include <chrono>
#include <functional>
#include <ec/crank/transaction-submitter.hpp>
#include <ec/ledger/records.hpp>

namespace evore_crank::crank {
    using sleep_func = std::function<void(std::chrono::milliseconds)>;

    // A cache of an on-ledger address lookup table that the batch capacity depends on.
    // Unloaded is a valid terminal state: the crank then operates with the smaller ceiling.
    struct lookup_table_manager {
        static constexpr size_t unloaded_ceiling = 2;
        static constexpr size_t loaded_ceiling = 5;
        static constexpr size_t extend_chunk_size = 20;
        // slots a deactivated table must wait before it can be closed
        static constexpr uint64_t close_cooldown_slots = 512;

        struct extend_result {
            size_t added = 0;
            size_t requested = 0;
            std::optional<std::string> error {};

            explicit operator bool() const
            {
                return !static_cast<bool>(error);
            }
        };

        lookup_table_manager(ledger::reader &reader, transaction_submitter &submitter, sleep_func sleep,
            std::chrono::milliseconds confirm_interval=std::chrono::milliseconds { 400 }, size_t confirm_attempts=75);

        // Replaces the cache with the table's current on-ledger contents.
        const ledger::lookup_table_record &load(const ledger::pubkey &address);
        // Allocates a new empty table owned by the payer and loads it once the creation is confirmed.
        ledger::pubkey create(uint64_t recent_slot);
        [[nodiscard]] ledger::pubkey_list missing_addresses(const ledger::pubkey_list &candidates) const;
        // Appends in chunks and adds each chunk to the cache only after its confirmation; stops at the first failed chunk.
        extend_result extend(const ledger::pubkey_list &addresses);
        void deactivate();
        void close(const ledger::pubkey &recipient);

        bool loaded() const
        {
            return static_cast<bool>(_address);
        }

        // A loaded table can be referenced by new transactions only while active.
        bool usable() const
        {
            return loaded() && _record.active();
        }

        size_t capacity_ceiling() const
        {
            return usable() ? loaded_ceiling : unloaded_ceiling;
        }

        bool contains(const ledger::pubkey &addr) const
        {
            return _known.contains(addr);
        }

        bool contains_all(const ledger::pubkey_list &addrs) const
        {
            return std::all_of(addrs.begin(), addrs.end(), [&](const auto &a) { return contains(a); });
        }

        const std::optional<ledger::pubkey> &address() const
        {
            return _address;
        }

        const ledger::pubkey_list &known_addresses() const
        {
            return _record.addresses;
        }

        const ledger::lookup_table_record &record() const
        {
            return _record;
        }

        // The view used to compile accelerated transactions, if the table can be used.
        std::optional<ledger::address_table> table() const;
    private:
        ledger::reader &_reader;
        transaction_submitter &_submitter;
        sleep_func _sleep;
        const std::chrono::milliseconds _confirm_interval;
        const size_t _confirm_attempts;
        std::optional<ledger::pubkey> _address {};
        ledger::lookup_table_record _record {};
        set<ledger::pubkey> _known {};

        const ledger::pubkey &_require_loaded() const;
        ledger::confirmation_status _await(const ledger::signature &sig);
        void _submit_and_confirm(const ledger::instruction_list &ixs, std::string_view what);
    };
}

#endif // !EVORE_CRANK_CRANK_LOOKUP_TABLE_MANAGER_HPP
