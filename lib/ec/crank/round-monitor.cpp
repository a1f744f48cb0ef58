/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/round-monitor.hpp>
#include <ec/ledger/address.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    round_phase classify_phase(const uint64_t end_slot, const uint64_t current_slot, const uint64_t intermission_window)
    {
        if (end_slot == ledger::board_end_unbounded)
            return round_phase::waiting;
        if (current_slot <= end_slot)
            return round_phase::active;
        if (current_slot - end_slot <= intermission_window)
            return round_phase::intermission;
        return round_phase::awaiting_reset;
    }

    round_monitor::round_monitor(ledger::reader &reader, const uint64_t intermission_window):
        _reader { reader }, _intermission_window { intermission_window }
    {
    }

    round_status round_monitor::poll()
    {
        const auto &board_addr = ledger::shared_addresses::get().board.address;
        const auto board_acc = _reader.get_account(board_addr);
        if (!board_acc)
            throw ledger_unavailable(fmt::format("the board account {} is missing", board_addr));
        const auto current_slot = _reader.get_slot();
        ledger::board_record board {};
        try {
            board = ledger::board_record::decode(board_acc->data);
        } catch (const decode_error &ex) {
            throw ledger_unavailable("the board account cannot be decoded", ex);
        }
        if (_last_round_id && board.round_id < *_last_round_id)
            throw ledger_unavailable(fmt::format("the ledger reports round {} after round {} has been observed", board.round_id, *_last_round_id));
        round_status st {
            .round_id=board.round_id,
            .phase=classify_phase(board.end_slot, current_slot, _intermission_window),
            .current_slot=current_slot,
            .start_slot=board.start_slot,
            .end_slot=board.end_slot,
            .round_changed=!_last_round_id || *_last_round_id != board.round_id
        };
        if (st.phase == round_phase::active)
            st.slots_remaining = board.end_slot - current_slot;
        if (st.round_changed)
            logger::info("round {} observed: {} with end slot {} at slot {}", st.round_id, st.phase,
                board.end_slot == ledger::board_end_unbounded ? std::string { "unbounded" } : fmt::format("{}", board.end_slot), current_slot);
        _last_round_id = board.round_id;
        return st;
    }
}
