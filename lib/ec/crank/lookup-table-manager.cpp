/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/lookup-table-manager.hpp>
#include <ec/ledger/instructions.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    lookup_table_manager::lookup_table_manager(ledger::reader &reader, transaction_submitter &submitter, sleep_func sleep,
            const std::chrono::milliseconds confirm_interval, const size_t confirm_attempts):
        _reader { reader }, _submitter { submitter }, _sleep { std::move(sleep) },
        _confirm_interval { confirm_interval }, _confirm_attempts { confirm_attempts }
    {
        if (!_sleep)
            throw error("lookup_table_manager requires a sleep function");
        if (_confirm_attempts == 0)
            throw error("lookup_table_manager requires at least one confirmation attempt");
    }

    const ledger::lookup_table_record &lookup_table_manager::load(const ledger::pubkey &address)
    {
        const auto acc = _reader.get_account(address);
        if (!acc)
            throw error(fmt::format("lookup table {} does not exist", address));
        if (acc->owner != ledger::program::address_lookup_table())
            throw decode_error(fmt::format("account {} is owned by {} and is not a lookup table", address, acc->owner));
        auto rec = ledger::lookup_table_record::decode(acc->data);
        _known.clear();
        _known.insert(rec.addresses.begin(), rec.addresses.end());
        _record = std::move(rec);
        _address = address;
        logger::info("lookup table {} loaded: {} addresses{}", address, _record.addresses.size(),
            _record.active() ? std::string {} : fmt::format(", deactivated at slot {}", _record.deactivation_slot));
        return _record;
    }

    ledger::pubkey lookup_table_manager::create(const uint64_t recent_slot)
    {
        const auto &payer = _submitter.payer();
        auto [ix, table] = ledger::lookup_table_program::create(payer, payer, recent_slot);
        _submit_and_confirm({ std::move(ix) }, "create lookup table");
        _known.clear();
        _record = ledger::lookup_table_record { .authority=payer };
        _address = table.address;
        logger::info("lookup table {} created", table.address);
        return table.address;
    }

    ledger::pubkey_list lookup_table_manager::missing_addresses(const ledger::pubkey_list &candidates) const
    {
        ledger::pubkey_list missing {};
        set<ledger::pubkey> seen {};
        for (const auto &addr: candidates) {
            if (!_known.contains(addr) && seen.emplace(addr).second)
                missing.emplace_back(addr);
        }
        return missing;
    }

    lookup_table_manager::extend_result lookup_table_manager::extend(const ledger::pubkey_list &addresses)
    {
        const auto &table = _require_loaded();
        const auto missing = missing_addresses(addresses);
        extend_result res { .requested=missing.size() };
        if (_record.addresses.size() + missing.size() > ledger::lookup_table_record::max_addresses) {
            res.error = fmt::format("lookup table {} cannot hold {} more addresses", table, missing.size());
            return res;
        }
        const auto &payer = _submitter.payer();
        for (size_t start = 0; start < missing.size(); start += extend_chunk_size) {
            const auto end = std::min(missing.size(), start + extend_chunk_size);
            const ledger::pubkey_list chunk { missing.begin() + static_cast<std::ptrdiff_t>(start), missing.begin() + static_cast<std::ptrdiff_t>(end) };
            try {
                _submit_and_confirm({ ledger::lookup_table_program::extend(table, payer, payer, chunk) }, "extend lookup table");
            } catch (const std::exception &ex) {
                res.error = fmt::format("{}: {}", error_kind(ex), ex.what());
                logger::warn("lookup table {}: extension stopped after {} of {} addresses: {}", table, res.added, missing.size(), *res.error);
                return res;
            }
            for (const auto &addr: chunk) {
                _record.addresses.emplace_back(addr);
                _known.emplace(addr);
            }
            res.added += chunk.size();
            logger::info("lookup table {}: {} addresses added, {} in total", table, chunk.size(), _record.addresses.size());
        }
        return res;
    }

    void lookup_table_manager::deactivate()
    {
        const auto table = _require_loaded();
        if (!_record.active())
            throw error(fmt::format("lookup table {} has already been deactivated at slot {}", table, _record.deactivation_slot));
        _submit_and_confirm({ ledger::lookup_table_program::deactivate(table, _submitter.payer()) }, "deactivate lookup table");
        load(table);
    }

    void lookup_table_manager::close(const ledger::pubkey &recipient)
    {
        const auto table = _require_loaded();
        if (_record.active())
            throw error(fmt::format("lookup table {} is still active and must be deactivated first", table));
        const auto slot = _reader.get_slot();
        if (const auto cooled = slot > _record.deactivation_slot ? slot - _record.deactivation_slot : 0; cooled < close_cooldown_slots)
            throw error(fmt::format("lookup table {} can be closed in {} slots", table, close_cooldown_slots - cooled));
        _submit_and_confirm({ ledger::lookup_table_program::close(table, _submitter.payer(), recipient) }, "close lookup table");
        _address.reset();
        _record = {};
        _known.clear();
        logger::info("lookup table {} closed, rent returned to {}", table, recipient);
    }

    std::optional<ledger::address_table> lookup_table_manager::table() const
    {
        if (!usable())
            return {};
        return ledger::address_table { *_address, _record.addresses };
    }

    const ledger::pubkey &lookup_table_manager::_require_loaded() const
    {
        if (!_address)
            throw error("no lookup table has been loaded");
        return *_address;
    }

    ledger::confirmation_status lookup_table_manager::_await(const ledger::signature &sig)
    {
        for (size_t attempt = 0; attempt < _confirm_attempts; ++attempt) {
            if (attempt > 0)
                _sleep(_confirm_interval);
            if (const auto st = _reader.confirm_transaction(sig); st != ledger::confirmation_status::pending)
                return st;
        }
        return ledger::confirmation_status::pending;
    }

    void lookup_table_manager::_submit_and_confirm(const ledger::instruction_list &ixs, const std::string_view what)
    {
        const auto res = _submitter.submit(ixs);
        if (!res)
            throw submit_rejected(fmt::format("{}: {}", what, *res.error));
        switch (const auto st = _await(*res.sig); st) {
            case ledger::confirmation_status::confirmed:
                logger::debug("{}: {} confirmed", what, *res.sig);
                break;
            case ledger::confirmation_status::failed:
                throw submit_rejected(fmt::format("{}: transaction {} failed", what, *res.sig));
            default:
                throw ledger_unavailable(fmt::format("{}: transaction {} is still unconfirmed", what, *res.sig));
        }
    }
}
