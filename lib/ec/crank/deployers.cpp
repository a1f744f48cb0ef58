/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/deployers.hpp>
#include <ec/ledger/address.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    deployer_list discover_deployers(ledger::reader &reader, const ledger::pubkey &authority, const uint64_t auth_id)
    {
        ledger::filter_list filters {};
        {
            uint8_vector tag {};
            append_le(tag, ledger::deployer_record::tag);
            filters.emplace_back(ledger::memcmp_filter { 0, std::move(tag) });
            filters.emplace_back(ledger::memcmp_filter { ledger::deployer_record::deploy_authority_offset, uint8_vector { static_cast<buffer>(authority) } });
        }
        const auto accounts = reader.get_program_accounts(ledger::program::evore(), filters);
        deployer_list deployers {};
        for (const auto &acc: accounts) {
            try {
                auto rec = ledger::deployer_record::decode(acc.account.data);
                auto addrs = ledger::deployer_addresses::derive(rec.manager, auth_id);
                if (addrs.deployer.address != acc.address) {
                    logger::warn("deployer {}: the record's manager {} derives a different address {}, skipping",
                        acc.address, rec.manager, addrs.deployer.address);
                    continue;
                }
                deployers.emplace_back(deployer { acc.address, std::move(rec), std::move(addrs), 0 });
            } catch (const decode_error &ex) {
                logger::warn("deployer {}: skipping an undecodable record: {}", acc.address, ex.what());
            }
        }
        std::sort(deployers.begin(), deployers.end(), [](const auto &a, const auto &b) { return a.address < b.address; });
        logger::info("discovered {} deployers of authority {} out of {} matching accounts", deployers.size(), authority, accounts.size());
        return deployers;
    }

    ledger::pubkey_list lookup_candidates(const deployer_list &deployers)
    {
        ledger::pubkey_list res {};
        set<ledger::pubkey> seen {};
        const auto add = [&](const ledger::pubkey_list &addrs) {
            for (const auto &a: addrs) {
                if (seen.emplace(a).second)
                    res.emplace_back(a);
            }
        };
        add(ledger::shared_addresses::get().lookup_candidates());
        for (const auto &dep: deployers)
            add(dep.addrs.lookup_candidates(dep.manager()));
        return res;
    }
}
