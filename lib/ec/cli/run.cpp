/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <csignal>
#include <ec/cli/common.hpp>
#include <ec/crank/scheduler.hpp>

namespace evore_crank::cli::run_loop {
    namespace {
        std::atomic_bool stop_requested { false };

        void on_stop_signal(const int)
        {
            stop_requested = true;
        }
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "run";
            cmd.desc = "deploy for every eligible deployer in every round until interrupted";
            cmd.opts.try_emplace("max-cycles", "stop after this many cycles");
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            std::optional<size_t> max_cycles {};
            if (const auto it = opts.find("max-cycles"); it != opts.end()) {
                if (!it->second)
                    throw configuration_error("max-cycles: a value is required");
                max_cycles = crank::parse_u64("max-cycles", *it->second);
            }
            common::session s { opts };
            crank::context ctx { s.reader, s.cfg, s.authority, s.deployers(), common::thread_sleep };
            if (ctx.deployers.empty())
                logger::warn("no deployers delegate to {}; the crank will only watch rounds", s.authority.public_key);
            if (s.cfg.lut_address)
                _prepare_lut(s, ctx);
            std::signal(SIGINT, on_stop_signal);
            std::signal(SIGTERM, on_stop_signal);
            crank::scheduler sched { ctx };
            sched.run(max_cycles, stop_requested);
        }
    private:
        static void _prepare_lut(common::session &s, crank::context &ctx)
        {
            if (logger::run_log_errors([&] { s.load_lut(ctx.luts); })) {
                logger::warn("continuing without the lookup table {}", *s.cfg.lut_address);
                return;
            }
            if (!ctx.luts.usable()) {
                logger::warn("the lookup table {} is deactivated; continuing without it", *s.cfg.lut_address);
                return;
            }
            if (s.cfg.lut_auto_extend) {
                const auto missing = ctx.luts.missing_addresses(crank::lookup_candidates(ctx.deployers));
                if (!missing.empty()) {
                    const auto res = ctx.luts.extend(missing);
                    if (!res)
                        logger::warn("extended the lookup table by {} out of {} addresses: {}", res.added, res.requested, *res.error);
                }
            }
            logger::info("using the lookup table {} with {} addresses", *s.cfg.lut_address, ctx.luts.known_addresses().size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
