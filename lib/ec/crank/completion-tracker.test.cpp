/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/completion-tracker.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

suite crank_completion_tracker_suite = [] {
    "crank::completion_tracker"_test = [] {
        "mark and query"_test = [] {
            completion_tracker_memory tracker {};
            const auto a = ledger::mock_address(1);
            const auto b = ledger::mock_address(2);
            expect(!tracker.contains(a, 5));
            tracker.mark_submitted(a, 5);
            tracker.mark_submitted(a, 5);
            expect(tracker.contains(a, 5));
            expect(!tracker.contains(a, 6));
            expect(!tracker.contains(b, 5));
            test_same(size_t { 1 }, tracker.size());
        };
        "round change"_test = [] {
            completion_tracker_memory tracker {};
            const auto a = ledger::mock_address(1);
            const auto b = ledger::mock_address(2);
            tracker.mark_submitted(a, 5);
            tracker.mark_submitted(b, 6);
            tracker.on_round_change(6);
            expect(!tracker.contains(a, 5));
            expect(tracker.contains(b, 6));
            test_same(size_t { 1 }, tracker.size());
            tracker.on_round_change(7);
            test_same(size_t { 0 }, tracker.size());
        };
    };
};
