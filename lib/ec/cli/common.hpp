/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CLI_COMMON_HPP
#define EVORE_CRANK_CLI_COMMON_HPP

#include <ec/cli.hpp>
#include <ec/crank/deployers.hpp>
#include <ec/crank/lookup-table-manager.hpp>
#include <ec/crank/settings.hpp>
#include <ec/ledger/rpc-reader.hpp>

namespace evore_crank::cli::common {
    // Registers --config and one option per overridable setting.
    extern void add_opts(config &cmd);
    extern crank::settings load_settings(const options &opts);
    extern void thread_sleep(std::chrono::milliseconds duration);

    // What every command that talks to the ledger needs.
    struct session {
        const crank::settings cfg;
        const ledger::keypair authority;
        ledger::rpc_reader reader;
        crank::transaction_submitter submitter;

        explicit session(const options &opts);
        session(const session &) =delete;

        crank::deployer_list deployers()
        {
            return crank::discover_deployers(reader, authority.public_key, cfg.auth_id);
        }

        // Loads the configured table; throws configuration_error when none is configured.
        void load_lut(crank::lookup_table_manager &luts) const;
    };
}

#endif // !EVORE_CRANK_CLI_COMMON_HPP
