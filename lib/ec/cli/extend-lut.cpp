/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::extend_lut {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "extend-lut";
            cmd.desc = "add every shared and deployer address missing from the configured lookup table";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            crank::lookup_table_manager luts { s.reader, s.submitter, common::thread_sleep };
            s.load_lut(luts);
            if (!luts.usable())
                throw error(fmt::format("the lookup table {} is deactivated", *s.cfg.lut_address));
            const auto missing = luts.missing_addresses(crank::lookup_candidates(s.deployers()));
            if (missing.empty()) {
                logger::info("the lookup table {} already holds all {} addresses", *s.cfg.lut_address, luts.known_addresses().size());
                return;
            }
            const auto res = luts.extend(missing);
            if (!res)
                throw error(fmt::format("added {} out of {} addresses: {}", res.added, res.requested, *res.error));
            logger::info("added {} addresses; the lookup table {} now holds {}", res.added, *s.cfg.lut_address, luts.known_addresses().size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
