/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_JSON_HPP
#define EVORE_CRANK_JSON_HPP

#include <boost/json.hpp>
#include <ec/common/file.hpp>

namespace evore_crank::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // Walks a chain of object keys and returns nullptr when any element is absent.
    inline const json::value *find_path(const json::value &root, const std::initializer_list<std::string_view> &keys)
    {
        const json::value *cur = &root;
        for (const auto &k: keys) {
            const auto *obj = cur->if_object();
            if (!obj)
                return nullptr;
            const auto it = obj->find(k);
            if (it == obj->end())
                return nullptr;
            cur = &it->value();
        }
        return cur;
    }

    inline uint64_t as_u64(const json::value &v)
    {
        if (v.is_uint64())
            return v.get_uint64();
        if (v.is_int64() && v.get_int64() >= 0)
            return static_cast<uint64_t>(v.get_int64());
        throw error(fmt::format("expected a non-negative integer but got {}", json::serialize(v)));
    }

    inline std::string_view as_sv(const json::value &v)
    {
        if (!v.is_string())
            throw error(fmt::format("expected a string but got {}", json::serialize(v)));
        return static_cast<std::string_view>(v.get_string());
    }
}

#endif // !EVORE_CRANK_JSON_HPP
