#pragma once
#ifndef CANON_CBOR_CONTAINER_HPP
#define CANON_CBOR_CONTAINER_HPP
/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <map>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <boost/container/flat_map.hpp>
#include <canon/common/format.hpp>

namespace canon_cbor {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;
    };

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

#endif //!CANON_CBOR_CONTAINER_HPP
