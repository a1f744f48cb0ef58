/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/ed25519.hpp>

using namespace evore_crank;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        "sign and verify"_test = [] {
            ed25519::seed seed {};
            seed.fill(7);
            const auto [sk, vk] = ed25519::create_from_seed(seed);
            test_same(vk, ed25519::extract_vk(sk));
            const std::string_view msg { "deploy" };
            const auto sig = ed25519::sign(msg, sk);
            expect(ed25519::verify(sig, vk, msg));
            expect(!ed25519::verify(sig, vk, std::string_view { "deplox" }));
        };
        "seed size"_test = [] {
            expect(throws([] { ed25519::create_from_seed(uint8_vector(31)); }));
        };
        "curve points"_test = [] {
            ed25519::seed seed {};
            seed.fill(3);
            const auto [sk, vk] = ed25519::create_from_seed(seed);
            expect(ed25519::is_on_curve(vk));
        };
    };
};
