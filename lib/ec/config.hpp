/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CONFIG_HPP
#define EVORE_CRANK_CONFIG_HPP

#include <optional>
#include <ec/json.hpp>

namespace evore_crank {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = json();
            const auto it = obj.find(name);
            return it != obj.end() ? &it->value() : nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] const buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
        virtual const buffer _bytes_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }, _bytes { buffer { json::serialize(_json) } }
        {
        }
    private:
        const json::object _json;
        const uint8_vector _bytes;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw configuration_error(fmt::format("config does not have the requested {} element!", name));
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }

        const buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        static constexpr std::string_view default_path { "./etc/crank.json" };

        // The explicit path wins over EC_CONFIG which wins over the default path.
        static std::string path(const std::optional<std::string> &explicit_path);

        explicit config_file(const std::string &path);
    private:
        uint8_vector _raw;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }

        const buffer _bytes_impl() const override
        {
            return _raw;
        }
    };
}

#endif // !EVORE_CRANK_CONFIG_HPP
