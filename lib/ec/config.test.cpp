/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <ec/common/test.hpp>
#include <ec/config.hpp>

using namespace evore_crank;

namespace {
    std::string temp_path(const std::string_view name)
    {
        return (std::filesystem::temp_directory_path() / name).string();
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "mock"_test = [] {
            const config_json cfg { json::object { { "amount", 20'000 }, { "rpc_url", "http://127.0.0.1:8899" } } };
            test_same(uint64_t { 20'000 }, json::as_u64(cfg.at("amount")));
            test_same(std::string_view { "http://127.0.0.1:8899" }, json::as_sv(cfg.at("rpc_url")));
            expect(cfg.find("priority_fee") == nullptr);
            expect(throws<configuration_error>([&] { static_cast<void>(cfg.at("priority_fee")); }));
            expect(!cfg.bytes().empty());
        };
        "file"_test = [] {
            const auto path = temp_path("ec-config-test.json");
            file::write(path, std::string_view { R"({"auth_id": 3, "lut_auto_extend": true})" });
            const config_file cfg { path };
            test_same(uint64_t { 3 }, json::as_u64(cfg.at("auth_id")));
            expect(cfg.at("lut_auto_extend").as_bool());
            std::filesystem::remove(path);
        };
        "missing file"_test = [] {
            expect(throws<configuration_error>([] { config_file cfg { temp_path("ec-config-missing.json") }; }));
        };
        "not an object"_test = [] {
            const auto path = temp_path("ec-config-array.json");
            file::write(path, std::string_view { "[1, 2, 3]" });
            expect(throws<configuration_error>([&] { config_file cfg { path }; }));
            file::write(path, std::string_view { "{ broken" });
            expect(throws<configuration_error>([&] { config_file cfg { path }; }));
            std::filesystem::remove(path);
        };
        "path"_test = [] {
            test_same(std::string { "./custom.json" }, config_file::path("./custom.json"));
            if (std::getenv("EC_CONFIG") == nullptr)
                test_same(std::string { config_file::default_path }, config_file::path({}));
        };
    };
};
