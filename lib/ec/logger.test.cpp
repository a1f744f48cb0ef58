/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/logger.hpp>

using namespace evore_crank;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            size_t cleanups = 0;
            const auto ex2 = logger::run_log_errors([] { throw submit_rejected("refused"); }, [&] { ++cleanups; });
            expect(static_cast<bool>(ex2));
            test_same(size_t { 1 }, cleanups);
            expect(throws<submit_rejected>([&] { std::rethrow_exception(ex2); }));
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<ledger_unavailable>([] { logger::run_log_errors_rethrow([] { throw ledger_unavailable("down"); }); }));
        };
    };
};
