/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <ec/config.hpp>
#include <ec/logger.hpp>

namespace evore_crank {
    static uint8_vector read_config(const std::string &path)
    {
        try {
            return file::read(path);
        } catch (const std::exception &ex) {
            throw configuration_error(fmt::format("cannot read the configuration file {}", path), ex);
        }
    }

    static json::object parse_config(const std::string &path, const buffer raw)
    {
        try {
            auto j = json::parse(raw);
            if (!j.is_object())
                throw configuration_error(fmt::format("the configuration file {} must contain a JSON object", path));
            return std::move(j.as_object());
        } catch (const configuration_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw configuration_error(fmt::format("cannot parse the configuration file {}", path), ex);
        }
    }

    std::string config_file::path(const std::optional<std::string> &explicit_path)
    {
        std::optional<std::string> path = explicit_path;
        if (const char *env_path = std::getenv("EC_CONFIG"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace(default_path);
        logger::debug("configuration file: {}", *path);
        return *path;
    }

    config_file::config_file(const std::string &path)
        : _raw { read_config(path) }, _parsed { parse_config(path, _raw) }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw configuration_error(fmt::format("configuration file does not have the element {}!", name));
        return it->value();
    }
}
