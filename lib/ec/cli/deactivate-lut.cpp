/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::deactivate_lut {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "deactivate-lut";
            cmd.desc = "deactivate the configured lookup table so that it can later be closed";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            crank::lookup_table_manager luts { s.reader, s.submitter, common::thread_sleep };
            s.load_lut(luts);
            luts.deactivate();
            logger::info("the lookup table {} is deactivated at slot {}; it can be closed {} slots later",
                *s.cfg.lut_address, luts.record().deactivation_slot, crank::lookup_table_manager::close_cooldown_slots);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
