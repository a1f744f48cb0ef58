/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>

namespace evore_crank::cli::create_lut {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "create-lut";
            cmd.desc = "create an empty address lookup table owned by the deploy authority";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            if (s.cfg.lut_address)
                logger::warn("a lookup table {} is already configured; creating another one", *s.cfg.lut_address);
            crank::lookup_table_manager luts { s.reader, s.submitter, common::thread_sleep };
            const auto addr = luts.create(s.reader.get_slot());
            logger::info("created the lookup table {}; set LUT_ADDRESS={} and run extend-lut", addr, addr);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
