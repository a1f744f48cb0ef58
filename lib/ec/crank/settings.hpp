/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_SETTINGS_HPP
#define EVORE_CRANK_CRANK_SETTINGS_HPP

#include <chrono>
#include <functional>
#include <ec/config.hpp>
#include <ec/container.hpp>
#include <ec/crank/balance-calculator.hpp>
#include <ec/ledger/types.hpp>

namespace evore_crank::crank {
    using env_lookup = std::function<std::optional<std::string>(const std::string &)>;
    using setting_overrides = map<std::string, std::optional<std::string>>;

    struct settings {
        std::string rpc_url { "http://127.0.0.1:8899" };
        std::string keypair_path { "./etc/deploy-authority.json" };
        uint64_t amount_per_square = 10'000;
        uint32_t squares_mask = squares_mask_all;
        uint64_t auth_id = 0;
        std::chrono::milliseconds poll_interval { 400 };
        uint64_t priority_fee = 100'000;
        // a round is entered only when no more than this many slots are left
        uint64_t deploy_threshold_slots = 150;
        // and no fewer than this many
        uint64_t min_slots = 10;
        std::optional<ledger::pubkey> lut_address {};
        bool lut_auto_extend = false;
        std::chrono::milliseconds rpc_timeout { 10'000 };
        uint64_t intermission_window = 35;
        fee_schedule fees {};

        static env_lookup process_env();

        // Applies the layers lowest first: the defaults, the configuration file, the environment, the overrides.
        // Throws configuration_error when any value cannot be parsed or the result fails validate().
        static settings load(const config *cfg, const env_lookup &env, const setting_overrides &overrides={});

        struct option_info {
            std::string name;
            std::string desc;
        };

        // The command-line options accepted as overrides.
        static const vector<option_info> &options();

        void validate() const;
    };

    // Accepts decimal or 0x-prefixed hex; anything else, a sign included, is a configuration_error naming the setting.
    extern uint64_t parse_u64(std::string_view name, std::string_view s);

    // Reads a JSON array of 64 bytes: the 32-byte seed followed by the public key.
    extern ledger::keypair parse_keypair(const buffer &text);
    extern ledger::keypair load_keypair(const std::string &path);
}

#endif // !EVORE_CRANK_CRANK_SETTINGS_HPP
