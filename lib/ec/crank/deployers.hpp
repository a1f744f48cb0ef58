/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_DEPLOYERS_HPP
#define EVORE_CRANK_CRANK_DEPLOYERS_HPP

#include <ec/crank/types.hpp>
#include <ec/ledger/reader.hpp>

namespace evore_crank::crank {
    // Scans the evore program for deployer records delegated to the authority.
    // Records that fail to decode are logged and left out. The result is sorted by address.
    extern deployer_list discover_deployers(ledger::reader &reader, const ledger::pubkey &authority, uint64_t auth_id);

    // The shared addresses followed by every deployer's own, without duplicates and in a stable order.
    extern ledger::pubkey_list lookup_candidates(const deployer_list &deployers);
}

#endif // !EVORE_CRANK_CRANK_DEPLOYERS_HPP
