/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_ED25519_HPP
#define EVORE_CRANK_ED25519_HPP

#include <ec/array.hpp>

namespace evore_crank::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using signature = byte_array<64>;
    using seed = secure_byte_array<32>;

    extern void ensure_initialized();
    extern void create(std::span<uint8_t> sk, std::span<uint8_t> vk);
    extern std::pair<skey, vkey> create_from_seed(const buffer &seed);
    extern vkey extract_vk(const buffer &sk);
    extern signature sign(const buffer &msg, const buffer &sk);
    extern bool verify(const buffer &sig, const buffer &vk, const buffer &msg);
    // Program-derived addresses are valid only when they do not decode to a curve point.
    extern bool is_on_curve(const buffer &point);
}

#endif // !EVORE_CRANK_ED25519_HPP
