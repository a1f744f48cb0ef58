/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CONTAINER_HPP
#define EVORE_CRANK_CONTAINER_HPP

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_map.hpp>
#include <ec/common/format.hpp>

namespace evore_crank {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

#endif // !EVORE_CRANK_CONTAINER_HPP
