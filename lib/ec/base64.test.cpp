/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/base64.hpp>

using namespace evore_crank;

suite base64_suite = [] {
    "base64"_test = [] {
        "encode"_test = [] {
            test_same(std::string { "aGVsbG8=" }, base64::encode(std::string_view { "hello" }));
            test_same(std::string { "aGk=" }, base64::encode(std::string_view { "hi" }));
            test_same(std::string { "YWJj" }, base64::encode(std::string_view { "abc" }));
            test_same(std::string { "" }, base64::encode(uint8_vector {}));
        };
        "decode"_test = [] {
            static const vector<std::pair<std::string_view, uint8_vector>> test_vectors {
                { "6MA6A8Cy3b6kGVyvOfQeZp99JR7PIh+7LydcCl1+BdGQ3MJG9WyOM6wANwZuL2ZN2qmF6lKECCZDMI3eT1v+3w==", uint8_vector::from_hex("e8c03a03c0b2ddbea4195caf39f41e669f7d251ecf221fbb2f275c0a5d7e05d190dcc246f56c8e33ac0037066e2f664ddaa985ea5284082643308dde4f5bfedf") },
                { "aGVsbG8=", uint8_vector { std::string_view { "hello" } } },
                { "YWJj", uint8_vector { std::string_view { "abc" } } }
            };
            for (const auto &[in, exp]: test_vectors) {
                const auto out = base64::decode(in);
                expect(out == exp) << out;
            }
        };
        "invalid"_test = [] {
            expect(throws([] { base64::decode("a*b"); }));
        };
    };
};
