/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_COMPLETION_TRACKER_HPP
#define EVORE_CRANK_CRANK_COMPLETION_TRACKER_HPP

#include <ec/ledger/types.hpp>

namespace evore_crank::crank {
    // Remembers which deployers have already acted in a round.
    // Entries are added on submission, before confirmation, and live only as long as the process.
    struct completion_tracker {
        virtual ~completion_tracker() =default;

        void mark_submitted(const ledger::pubkey &deployer, const uint64_t round_id)
        {
            _mark_submitted_impl(deployer, round_id);
        }

        void on_round_change(const uint64_t new_round_id)
        {
            _on_round_change_impl(new_round_id);
        }

        [[nodiscard]] bool contains(const ledger::pubkey &deployer, const uint64_t round_id) const
        {
            return _contains_impl(deployer, round_id);
        }

        [[nodiscard]] size_t size() const
        {
            return _size_impl();
        }
    private:
        virtual void _mark_submitted_impl(const ledger::pubkey &deployer, uint64_t round_id) =0;
        virtual void _on_round_change_impl(uint64_t new_round_id) =0;
        virtual bool _contains_impl(const ledger::pubkey &deployer, uint64_t round_id) const =0;
        virtual size_t _size_impl() const =0;
    };

    struct completion_tracker_memory: completion_tracker {
    private:
        using key_type = std::pair<ledger::pubkey, uint64_t>;
        set<key_type> _entries {};

        void _mark_submitted_impl(const ledger::pubkey &deployer, const uint64_t round_id) override
        {
            _entries.emplace(deployer, round_id);
        }

        void _on_round_change_impl(const uint64_t new_round_id) override
        {
            std::erase_if(_entries, [new_round_id](const auto &e) { return e.second != new_round_id; });
        }

        bool _contains_impl(const ledger::pubkey &deployer, const uint64_t round_id) const override
        {
            return _entries.contains(key_type { deployer, round_id });
        }

        size_t _size_impl() const override
        {
            return _entries.size();
        }
    };
}

#endif // !EVORE_CRANK_CRANK_COMPLETION_TRACKER_HPP
