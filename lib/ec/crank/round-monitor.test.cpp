/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/round-monitor.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

suite crank_round_monitor_suite = [] {
    "crank::round_monitor"_test = [] {
        "classify_phase"_test = [] {
            test_same(round_phase::waiting, classify_phase(ledger::board_end_unbounded, 100, 35));
            test_same(round_phase::active, classify_phase(200, 150, 35));
            test_same(round_phase::active, classify_phase(200, 200, 35));
            test_same(round_phase::intermission, classify_phase(200, 201, 35));
            test_same(round_phase::intermission, classify_phase(200, 235, 35));
            test_same(round_phase::awaiting_reset, classify_phase(200, 236, 35));
        };
        "phases of a round"_test = [] {
            ledger::reader_mock m {};
            m.set_board(5, 100, 200);
            m.slot = 150;
            round_monitor mon { m };
            auto st = mon.poll();
            test_same(uint64_t { 5 }, st.round_id);
            test_same(round_phase::active, st.phase);
            test_same(uint64_t { 50 }, st.slots_remaining);
            test_same(uint64_t { 150 }, st.current_slot);
            test_same(uint64_t { 100 }, st.start_slot);
            test_same(uint64_t { 200 }, st.end_slot);
            expect(st.round_changed);
            test_same(std::optional<uint64_t> { 5 }, mon.last_round_id());

            m.slot = 200;
            st = mon.poll();
            test_same(round_phase::active, st.phase);
            test_same(uint64_t { 0 }, st.slots_remaining);
            expect(!st.round_changed);

            m.slot = 235;
            st = mon.poll();
            test_same(round_phase::intermission, st.phase);
            test_same(uint64_t { 0 }, st.slots_remaining);

            m.slot = 236;
            test_same(round_phase::awaiting_reset, mon.poll().phase);

            m.set_board(6, 240, ledger::board_end_unbounded);
            m.slot = 240;
            st = mon.poll();
            test_same(uint64_t { 6 }, st.round_id);
            test_same(round_phase::waiting, st.phase);
            expect(st.round_changed);
        };
        "custom intermission window"_test = [] {
            ledger::reader_mock m {};
            m.set_board(5, 100, 200);
            m.slot = 211;
            round_monitor mon { m, 10 };
            test_same(round_phase::awaiting_reset, mon.poll().phase);
        };
        "failures"_test = [] {
            ledger::reader_mock m {};
            round_monitor mon { m };
            expect(throws<ledger_unavailable>([&] { mon.poll(); }));
            m.set_board(5, 100, 200);
            m.unavailable = true;
            expect(throws<ledger_unavailable>([&] { mon.poll(); }));
            m.unavailable = false;
            expect(nothrow([&] { mon.poll(); }));
            m.set_board(4, 100, 200);
            expect(throws<ledger_unavailable>([&] { mon.poll(); }));
            test_same(std::optional<uint64_t> { 5 }, mon.last_round_id());
            m.set_account(ledger::shared_addresses::get().board.address, uint8_vector::from_hex("0102"), 0, ledger::program::ore());
            expect(throws<ledger_unavailable>([&] { mon.poll(); }));
        };
    };
};
