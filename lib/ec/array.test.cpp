/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/array.hpp>

using namespace evore_crank;

suite array_suite = [] {
    "array"_test = [] {
        "initialize"_test = [] {
            const byte_array<4> a { 1, 2, 3, 4 };
            test_same(uint8_t { 1 }, a[0]);
            test_same(uint8_t { 4 }, a[3]);
            expect(throws([] { byte_array<4> b { 1, 2, 3 }; }));
        };
        "from_hex"_test = [] {
            const auto a = byte_array<4>::from_hex("DEADBEEF");
            test_same(uint8_t { 0xDE }, a[0]);
            test_same(uint8_t { 0xEF }, a[3]);
            test_same(std::string { "DEADBEEF" }, fmt::format("{}", a));
            expect(throws([] { byte_array<4>::from_hex("DEAD"); }));
            expect(throws([] { byte_array<4>::from_hex("DEADBEEG"); }));
        };
        "buffer"_test = [] {
            const auto bytes = uint8_vector::from_hex("0102030405");
            const byte_array<4> a { static_cast<buffer>(bytes).subbuf(1, 4) };
            test_same(uint8_t { 2 }, a[0]);
            const buffer view = a;
            test_same(size_t { 4 }, view.size());
            expect(throws([&] { byte_array<4> b { static_cast<buffer>(bytes) }; }));
            byte_array<4> c {};
            c = static_cast<buffer>(bytes).subbuf(0, 4);
            test_same(uint8_t { 1 }, c[0]);
        };
        "secure_clear"_test = [] {
            byte_array<8> a { 1, 2, 3, 4, 5, 6, 7, 8 };
            secure_clear(a);
            for (const auto v: a)
                expect(v == 0);
        };
    };
};
