/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::close_lut {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "close-lut";
            cmd.desc = "close the configured deactivated lookup table and reclaim its rent";
            cmd.opts.try_emplace("recipient", "the address to receive the rent; the deploy authority by default");
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            auto recipient = s.authority.public_key;
            if (const auto it = opts.find("recipient"); it != opts.end() && it->second)
                recipient = ledger::pubkey::from_base58(*it->second);
            crank::lookup_table_manager luts { s.reader, s.submitter, common::thread_sleep };
            s.load_lut(luts);
            luts.close(recipient);
            logger::info("closed the lookup table {}; the rent went to {}", *s.cfg.lut_address, recipient);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
