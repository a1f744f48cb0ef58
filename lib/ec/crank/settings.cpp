/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <cstdlib>
#include <limits>
#include <boost/url.hpp>
#include <ec/crank/settings.hpp>
#include <ec/ed25519.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    uint64_t parse_u64(const std::string_view name, const std::string_view s)
    {
        int base = 10;
        std::string_view digits = s;
        if (digits.starts_with("0x") || digits.starts_with("0X")) {
            base = 16;
            digits.remove_prefix(2);
        }
        uint64_t val = 0;
        const auto *end = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(digits.data(), end, val, base);
        if (digits.empty() || ec != std::errc {} || ptr != end)
            throw configuration_error(fmt::format("{}: not a valid non-negative integer: '{}'", name, s));
        return val;
    }

    namespace {
        using setter = std::function<void(settings &, const std::string &)>;

        struct field {
            std::string config_key;
            std::optional<std::string> env_name;
            std::string option;
            std::string desc;
            setter apply;
        };

        bool parse_bool(const std::string_view name, const std::string_view s)
        {
            if (s == "true" || s == "1" || s == "yes")
                return true;
            if (s == "false" || s == "0" || s == "no")
                return false;
            throw configuration_error(fmt::format("{}: not a valid boolean: '{}'", name, s));
        }

        template<typename T>
        setter u64_field(T settings::*member, const std::string name)
        {
            return [member, name](settings &s, const std::string &val) {
                const auto v = parse_u64(name, val);
                if (v > std::numeric_limits<T>::max())
                    throw configuration_error(fmt::format("{}: the value {} is out of range", name, v));
                s.*member = static_cast<T>(v);
            };
        }

        setter ms_field(std::chrono::milliseconds settings::*member, const std::string name)
        {
            return [member, name](settings &s, const std::string &val) {
                s.*member = std::chrono::milliseconds { parse_u64(name, val) };
            };
        }

        const vector<field> &fields()
        {
            static const vector<field> fs {
                { "rpc_url", "RPC_URL", "rpc-url", "the JSON-RPC endpoint of the ledger", [](settings &s, const std::string &v) { s.rpc_url = v; } },
                { "keypair", "DEPLOY_AUTHORITY_KEYPAIR", "keypair", "a JSON file with the deploy authority keypair", [](settings &s, const std::string &v) { s.keypair_path = v; } },
                { "amount", {}, "amount", "lamports to deploy per square", u64_field(&settings::amount_per_square, "amount") },
                { "squares_mask", {}, "squares-mask", "a bitmask of the squares to deploy to", u64_field(&settings::squares_mask, "squares_mask") },
                { "auth_id", {}, "auth-id", "the managed miner auth id", u64_field(&settings::auth_id, "auth_id") },
                { "poll_interval_ms", "POLL_INTERVAL_MS", "poll-interval-ms", "milliseconds between cycles", ms_field(&settings::poll_interval, "poll_interval_ms") },
                { "priority_fee", "PRIORITY_FEE", "priority-fee", "compute unit price in micro-lamports", u64_field(&settings::priority_fee, "priority_fee") },
                { "deploy_threshold_slots", {}, "threshold", "deploy only when at most this many slots are left", u64_field(&settings::deploy_threshold_slots, "deploy_threshold_slots") },
                { "min_slots", {}, "min-slots", "do not deploy when fewer slots are left", u64_field(&settings::min_slots, "min_slots") },
                { "lut_address", "LUT_ADDRESS", "lut", "the address of the lookup table to use", [](settings &s, const std::string &v) {
                    if (v.empty()) {
                        s.lut_address.reset();
                        return;
                    }
                    try {
                        s.lut_address = ledger::pubkey::from_base58(v);
                    } catch (const std::exception &ex) {
                        throw configuration_error(fmt::format("lut_address: not a valid address: '{}'", v), ex);
                    }
                } },
                { "lut_auto_extend", {}, "lut-auto-extend", "add missing addresses to the lookup table at start", [](settings &s, const std::string &v) { s.lut_auto_extend = parse_bool("lut_auto_extend", v); } },
                { "rpc_timeout_ms", {}, "rpc-timeout-ms", "the timeout of a single RPC call", ms_field(&settings::rpc_timeout, "rpc_timeout_ms") },
                { "intermission_window", {}, "intermission-window", "slots after the end of a round treated as intermission", u64_field(&settings::intermission_window, "intermission_window") }
            };
            return fs;
        }

        std::string config_value(const std::string_view key, const json::value &v)
        {
            if (v.is_string())
                return std::string { v.get_string() };
            if (v.is_uint64() || v.is_int64() || v.is_bool())
                return json::serialize(v);
            throw configuration_error(fmt::format("{}: unsupported configuration value: {}", key, json::serialize(v)));
        }

        void apply_fees(fee_schedule &fees, const json::value &v)
        {
            const auto *obj = v.if_object();
            if (!obj)
                throw configuration_error("fees: must be a JSON object");
            const std::initializer_list<std::pair<std::string_view, uint64_t fee_schedule::*>> known {
                { "rent_exempt_reserve", &fee_schedule::rent_exempt_reserve },
                { "checkpoint_fee", &fee_schedule::checkpoint_fee },
                { "miner_rent", &fee_schedule::miner_rent },
                { "deploy_fee", &fee_schedule::deploy_fee },
                { "balance_rent", &fee_schedule::balance_rent }
            };
            for (const auto &[name, member]: known) {
                if (const auto it = obj->find(name); it != obj->end())
                    fees.*member = parse_u64(name, config_value(name, it->value()));
            }
        }
    }

    env_lookup settings::process_env()
    {
        return [](const std::string &name) -> std::optional<std::string> {
            if (const char *val = std::getenv(name.c_str()); val)
                return std::string { val };
            return {};
        };
    }

    const vector<settings::option_info> &settings::options()
    {
        static const vector<option_info> opts = [] {
            vector<option_info> res {};
            for (const auto &f: fields())
                res.emplace_back(option_info { f.option, f.desc });
            return res;
        }();
        return opts;
    }

    settings settings::load(const config *cfg, const env_lookup &env, const setting_overrides &overrides)
    {
        settings s {};
        if (cfg) {
            for (const auto &f: fields()) {
                if (const auto *v = cfg->find(f.config_key); v)
                    f.apply(s, config_value(f.config_key, *v));
            }
            if (const auto *v = cfg->find("fees"); v)
                apply_fees(s.fees, *v);
        }
        for (const auto &f: fields()) {
            if (!f.env_name)
                continue;
            if (const auto val = env(*f.env_name); val) {
                logger::debug("setting {} taken from the environment variable {}", f.config_key, *f.env_name);
                f.apply(s, *val);
            }
        }
        for (const auto &f: fields()) {
            if (const auto it = overrides.find(f.option); it != overrides.end() && it->second)
                f.apply(s, *it->second);
        }
        s.validate();
        return s;
    }

    void settings::validate() const
    {
        const auto uri = boost::urls::parse_uri(rpc_url);
        if (!uri || uri->scheme() != "http")
            throw configuration_error(fmt::format("rpc_url must be an http url but got '{}'", rpc_url));
        if (keypair_path.empty())
            throw configuration_error("keypair path must not be empty");
        if (squares_mask == 0 || (squares_mask & ~squares_mask_all) != 0)
            throw configuration_error(fmt::format("squares_mask must select squares from 0 to 24 but got 0x{:X}", squares_mask));
        if (amount_per_square == 0)
            throw configuration_error("amount must be positive");
        if (poll_interval.count() == 0)
            throw configuration_error("poll_interval_ms must be positive");
        if (rpc_timeout.count() == 0)
            throw configuration_error("rpc_timeout_ms must be positive");
        if (min_slots > deploy_threshold_slots)
            throw configuration_error(fmt::format("min_slots {} must not exceed deploy_threshold_slots {}", min_slots, deploy_threshold_slots));
    }

    ledger::keypair parse_keypair(const buffer &text)
    {
        uint8_vector bytes {};
        try {
            const auto j = json::parse(text);
            const auto &arr = j.as_array();
            for (const auto &v: arr) {
                const auto b = json::as_u64(v);
                if (b > 0xFF)
                    throw error(fmt::format("byte value out of range: {}", b));
                bytes << static_cast<uint8_t>(b);
            }
        } catch (const std::exception &ex) {
            throw configuration_error("a keypair must be a JSON array of byte values", ex);
        }
        if (bytes.size() != 64)
            throw configuration_error(fmt::format("a keypair must have 64 bytes but got {}", bytes.size()));
        const auto [sk, vk] = ed25519::create_from_seed(static_cast<buffer>(bytes).subbuf(0, 32));
        ledger::keypair kp { sk, ledger::pubkey { vk } };
        if (kp.public_key != ledger::pubkey { static_cast<buffer>(bytes).subbuf(32, 32) })
            throw configuration_error("the keypair's public key does not match its seed");
        secure_clear(bytes);
        return kp;
    }

    ledger::keypair load_keypair(const std::string &path)
    {
        uint8_vector text {};
        try {
            text = file::read(path);
        } catch (const std::exception &ex) {
            throw configuration_error(fmt::format("cannot read the keypair file {}", path), ex);
        }
        return parse_keypair(text);
    }
}
