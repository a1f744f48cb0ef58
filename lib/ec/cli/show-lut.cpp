/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::show_lut {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "show-lut";
            cmd.desc = "show the configured lookup table and which addresses it still misses";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            crank::lookup_table_manager luts { s.reader, s.submitter, common::thread_sleep };
            s.load_lut(luts);
            const auto &rec = luts.record();
            logger::info("lookup table {} authority {} last extended at slot {}", *s.cfg.lut_address, rec.authority, rec.last_extended_slot);
            if (rec.active())
                logger::info("status: active");
            else
                logger::info("status: deactivated at slot {}", rec.deactivation_slot);
            for (size_t i = 0; i < rec.addresses.size(); ++i)
                logger::info("    #{}: {}", i, rec.addresses[i]);
            const auto candidates = crank::lookup_candidates(s.deployers());
            const auto missing = luts.missing_addresses(candidates);
            logger::info("{} addresses, {} out of {} crank addresses are missing", rec.addresses.size(), missing.size(), candidates.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
