/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <thread>
#include <ec/cli/common.hpp>

namespace evore_crank::cli::common {
    void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("config", "a JSON configuration file; EC_CONFIG or ./etc/crank.json when not given");
        for (const auto &opt: crank::settings::options())
            cmd.opts.try_emplace(opt.name, opt.desc);
    }

    crank::settings load_settings(const options &opts)
    {
        std::optional<std::string> explicit_path {};
        if (const auto it = opts.find("config"); it != opts.end() && it->second)
            explicit_path = *it->second;
        const auto path = config_file::path(explicit_path);
        std::unique_ptr<config_file> cfg {};
        if (path != config_file::default_path || std::filesystem::exists(path))
            cfg = std::make_unique<config_file>(path);
        else
            logger::info("the configuration file {} does not exist, using the defaults", path);
        return crank::settings::load(cfg.get(), crank::settings::process_env(), opts);
    }

    void thread_sleep(const std::chrono::milliseconds duration)
    {
        std::this_thread::sleep_for(duration);
    }

    session::session(const options &opts):
        cfg { load_settings(opts) },
        authority { crank::load_keypair(cfg.keypair_path) },
        reader { cfg.rpc_url, cfg.rpc_timeout },
        submitter { reader, authority }
    {
        logger::info("deploy authority: {} rpc: {}", authority.public_key, cfg.rpc_url);
    }

    void session::load_lut(crank::lookup_table_manager &luts) const
    {
        if (!cfg.lut_address)
            throw configuration_error("no lookup table is configured; pass --lut or set LUT_ADDRESS");
        luts.load(*cfg.lut_address);
    }
}
