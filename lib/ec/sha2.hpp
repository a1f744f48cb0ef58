/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_SHA2_HPP
#define EVORE_CRANK_SHA2_HPP

#include <initializer_list>
#include <ec/array.hpp>

namespace evore_crank::sha2 {
    using hash_256 = byte_array<32>;

    extern hash_256 digest(const buffer &in);
    // Hashes the concatenation of the parts without materializing it.
    extern hash_256 digest(std::initializer_list<buffer> parts);
}

#endif // !EVORE_CRANK_SHA2_HPP
