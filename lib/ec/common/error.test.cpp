/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstring>
#include <ec/common/test.hpp>
#include <ec/array.hpp>
#include <ec/common/error.hpp>

using namespace evore_crank;

namespace {
    template<typename E, typename F>
    void expect_throws_msg(const F &f, const std::string_view prefix, const std::source_location &loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), loc) << "no exception has been thrown";
        if (msg)
            expect(msg->starts_with(prefix), loc) << fmt::format("'{}' does not start with '{}'", *msg, prefix);
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "formatted"_test = [] {
            expect_throws_msg<error>([] { throw error(fmt::format("round {} is not active", 12)); }, "round 12 is not active");
        };
        "buffer"_test = [] {
            const byte_array<4> buf { 0xDE, 0xAD, 0xBE, 0xEF };
            expect_throws_msg<error>([&] { throw error(fmt::format("bad bytes {}", buf)); }, "bad bytes DEADBEEF");
        };
        "nested"_test = [] {
            expect_throws_msg<configuration_error>([] {
                try {
                    throw decode_error("short data");
                } catch (const std::exception &ex) {
                    throw configuration_error("cannot load", ex);
                }
            }, "cannot load caused by");
        };
        "error_sys"_test = [] {
            expect_throws_msg<error_sys>([] { errno = 2; throw error_sys("open failed"); }, "open failed errno: 2 strerror: No such file or directory");
        };
        "kinds"_test = [] {
            test_same(std::string_view { "ledger-unavailable" }, error_kind(ledger_unavailable("x")));
            test_same(std::string_view { "submit-rejected" }, error_kind(submit_rejected("x")));
            test_same(std::string_view { "decode-error" }, error_kind(decode_error("x")));
            test_same(std::string_view { "configuration-error" }, error_kind(configuration_error("x")));
            test_same(std::string_view { "error" }, error_kind(error("x")));
            test_same(std::string_view { "std-exception" }, error_kind(std::runtime_error("x")));
        };
        "hierarchy"_test = [] {
            expect(throws<error>([] { throw ledger_unavailable("down"); }));
            expect(throws<error>([] { throw submit_rejected("too big"); }));
            expect(throws<error>([] { throw decode_error("bad tag"); }));
            expect(throws<error>([] { throw configuration_error("bad url"); }));
        };
    };
};
