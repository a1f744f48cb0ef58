/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::list {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "list";
            cmd.desc = "show the deployers delegated to the deploy authority with their balances and fees";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            const auto deployers = s.deployers();
            ledger::pubkey_list addrs {};
            for (const auto &dep: deployers)
                addrs.emplace_back(dep.addrs.autodeploy_balance.address);
            const auto balances = s.reader.get_accounts(addrs);
            for (size_t i = 0; i < deployers.size(); ++i) {
                const auto &dep = deployers[i];
                const auto lamports = balances.at(i) ? balances.at(i)->lamports : 0;
                logger::info("deployer {} manager {} balance {}.{:09} SOL bps fee {} flat fee {} max per round {}",
                    dep.address, dep.manager(), lamports / ledger::lamports_per_sol, lamports % ledger::lamports_per_sol,
                    dep.record.bps_fee, dep.record.flat_fee, dep.record.max_per_round);
                logger::info("    autodeploy balance {} managed miner auth {} miner {} automation {}",
                    dep.addrs.autodeploy_balance.address, dep.addrs.managed_miner_auth.address,
                    dep.addrs.ore_miner.address, dep.addrs.automation.address);
            }
            logger::info("{} deployers in total", deployers.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
