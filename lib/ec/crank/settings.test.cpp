/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/common/test.hpp>
#include <ec/crank/settings.hpp>
#include <ec/ledger/reader-mock.hpp>

using namespace evore_crank;
using namespace evore_crank::crank;

namespace {
    env_lookup make_env(map<std::string, std::string> vals)
    {
        return [vals=std::move(vals)](const std::string &name) -> std::optional<std::string> {
            if (const auto it = vals.find(name); it != vals.end())
                return it->second;
            return {};
        };
    }

    settings load_with(const setting_overrides &overrides)
    {
        return settings::load(nullptr, make_env({}), overrides);
    }

    std::string keypair_json(const ledger::keypair &kp, const uint8_t seed_byte, const size_t num_bytes=64)
    {
        std::string res { "[" };
        for (size_t i = 0; i < num_bytes; ++i) {
            const unsigned b = i < 32 ? seed_byte : kp.public_key[(i - 32) % 32];
            res += fmt::format("{}{}", i ? "," : "", b);
        }
        res += "]";
        return res;
    }
}

suite crank_settings_suite = [] {
    "crank::settings"_test = [] {
        "defaults"_test = [] {
            const auto s = settings::load(nullptr, make_env({}));
            test_same(std::string { "http://127.0.0.1:8899" }, s.rpc_url);
            test_same(uint64_t { 10'000 }, s.amount_per_square);
            test_same(squares_mask_all, s.squares_mask);
            test_same(std::chrono::milliseconds { 400 }, s.poll_interval);
            test_same(uint64_t { 100'000 }, s.priority_fee);
            test_same(uint64_t { 150 }, s.deploy_threshold_slots);
            test_same(uint64_t { 10 }, s.min_slots);
            test_same(uint64_t { 35 }, s.intermission_window);
            expect(!s.lut_address);
            expect(!s.lut_auto_extend);
            expect(s.fees == fee_schedule {});
        };
        "layers"_test = [] {
            const config_json cfg { json::object {
                { "rpc_url", "http://config:1" },
                { "keypair", "/tmp/config-kp.json" },
                { "amount", 20'000 },
                { "priority_fee", "0x10" },
                { "lut_auto_extend", true },
                { "squares_mask", "0xFF" },
                { "fees", json::object { { "checkpoint_fee", 1 }, { "deploy_fee", "2" } } }
            } };
            const auto env = make_env({ { "RPC_URL", "http://env:2" }, { "PRIORITY_FEE", "5" }, { "POLL_INTERVAL_MS", "250" } });
            const auto from_cfg = settings::load(&cfg, make_env({}));
            test_same(std::string { "http://config:1" }, from_cfg.rpc_url);
            test_same(std::string { "/tmp/config-kp.json" }, from_cfg.keypair_path);
            test_same(uint64_t { 20'000 }, from_cfg.amount_per_square);
            test_same(uint64_t { 16 }, from_cfg.priority_fee);
            test_same(uint32_t { 0xFF }, from_cfg.squares_mask);
            expect(from_cfg.lut_auto_extend);
            test_same(uint64_t { 1 }, from_cfg.fees.checkpoint_fee);
            test_same(uint64_t { 2 }, from_cfg.fees.deploy_fee);
            test_same(fee_schedule {}.miner_rent, from_cfg.fees.miner_rent);

            const auto from_env = settings::load(&cfg, env);
            test_same(std::string { "http://env:2" }, from_env.rpc_url);
            test_same(uint64_t { 5 }, from_env.priority_fee);
            test_same(std::chrono::milliseconds { 250 }, from_env.poll_interval);
            test_same(uint64_t { 20'000 }, from_env.amount_per_square);

            const auto from_opts = settings::load(&cfg, env, { { "rpc-url", "http://opt:3" }, { "priority-fee", std::nullopt }, { "amount", "7" } });
            test_same(std::string { "http://opt:3" }, from_opts.rpc_url);
            test_same(uint64_t { 5 }, from_opts.priority_fee);
            test_same(uint64_t { 7 }, from_opts.amount_per_square);
        };
        "lookup table address"_test = [] {
            const auto addr = ledger::program::address_lookup_table();
            const auto s = load_with({ { "lut", addr.to_base58() } });
            expect(fatal(s.lut_address.has_value()));
            test_same(addr, *s.lut_address);
            const config_json cfg { json::object { { "lut_address", addr.to_base58() } } };
            expect(!settings::load(&cfg, make_env({}), { { "lut", "" } }).lut_address);
            expect(throws<configuration_error>([] { static_cast<void>(load_with({ { "lut", "not-an-address!" } })); }));
        };
        "validation"_test = [] {
            for (const auto &[opt, val]: vector<std::pair<std::string, std::string>> {
                { "rpc-url", "https://127.0.0.1:8899" },
                { "rpc-url", "not a url" },
                { "keypair", "" },
                { "squares-mask", "0" },
                { "squares-mask", "0x2000000" },
                { "squares-mask", "0x100000000" },
                { "amount", "0" },
                { "amount", "abc" },
                { "amount", "-1" },
                { "poll-interval-ms", "0" },
                { "rpc-timeout-ms", "0" },
                { "min-slots", "151" },
                { "lut-auto-extend", "maybe" }
            }) {
                expect(throws<configuration_error>([&] { static_cast<void>(load_with({ { opt, val } })); })) << opt << "=" << val;
            }
            expect(nothrow([] { static_cast<void>(load_with({ { "min-slots", "150" }, { "lut-auto-extend", "yes" } })); }));
            const config_json bad_cfg { json::object { { "amount", json::array { 1, 2 } } } };
            expect(throws<configuration_error>([&] { static_cast<void>(settings::load(&bad_cfg, make_env({}))); }));
        };
        "integer values"_test = [] {
            test_same(uint64_t { 25 }, parse_u64("max-cycles", "25"));
            test_same(uint64_t { 255 }, parse_u64("max-cycles", "0xff"));
            test_same(uint64_t { 0 }, parse_u64("max-cycles", "0"));
            for (const std::string_view bad: { "", "-1", "+1", "abc", "12x", "0x", " 7", "18446744073709551616" })
                expect(throws<configuration_error>([&] { static_cast<void>(parse_u64("max-cycles", bad)); })) << bad;
            try {
                static_cast<void>(parse_u64("max-cycles", "-1"));
                expect(false);
            } catch (const configuration_error &ex) {
                expect(std::string_view { ex.what() }.find("max-cycles") != std::string_view::npos);
            }
        };
        "fee settings"_test = [] {
            const config_json cfg { json::object { { "fees", json::object { { "balance_rent", 1'000 } } } } };
            const auto s = settings::load(&cfg, make_env({}));
            test_same(uint64_t { 1'000 }, s.fees.balance_rent);
            test_same(fee_schedule {}.deploy_fee, s.fees.deploy_fee);
            test_same(uint64_t { 890'880 }, fee_schedule {}.balance_rent);
        };
        "options"_test = [] {
            const auto &opts = settings::options();
            test_same(size_t { 13 }, opts.size());
            test_same(std::string { "rpc-url" }, opts.at(0).name);
            expect(std::any_of(opts.begin(), opts.end(), [](const auto &o) { return o.name == "lut"; }));
        };
        "keypair"_test = [] {
            const auto kp = ledger::mock_keypair(7);
            const auto parsed = parse_keypair(keypair_json(kp, 7));
            test_same(kp.public_key, parsed.public_key);
            expect(parsed.secret == kp.secret);
            expect(throws<configuration_error>([&] { static_cast<void>(parse_keypair(keypair_json(kp, 8))); }));
            expect(throws<configuration_error>([&] { static_cast<void>(parse_keypair(keypair_json(kp, 7, 63))); }));
            expect(throws<configuration_error>([] { static_cast<void>(parse_keypair(std::string_view { "{\"seed\":1}" })); }));
            expect(throws<configuration_error>([] { static_cast<void>(parse_keypair(std::string_view { "[256]" })); }));
            expect(throws<configuration_error>([] { static_cast<void>(load_keypair("./tmp/no-such-keypair.json")); }));
        };
    };
};
