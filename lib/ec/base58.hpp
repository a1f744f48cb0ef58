/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_BASE58_HPP
#define EVORE_CRANK_BASE58_HPP

#include <string>
#include <ec/common/bytes.hpp>

// Bitcoin-alphabet base58 as used for ledger addresses and transaction signatures.
namespace evore_crank::base58 {
    extern std::string encode(const buffer &data);
    extern uint8_vector decode(std::string_view text);
}

#endif // !EVORE_CRANK_BASE58_HPP
