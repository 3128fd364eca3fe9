#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "macros.h"

#include <cstddef>
#include <functional>
#include <utility>

#include <immer/map.hpp>

// Persistent hash map; every modification yields a new version and leaves
// copies of the old one untouched, so a published version can be read
// without locking.
template<typename K, typename V, typename Hash = std::hash<K>>
struct NODISCARD ImmUnorderedMap final
{
    using Map = immer::map<K, V, Hash>;

private:
    Map m_map;

public:
    NODISCARD const V *find(const K &key) const { return m_map.find(key); }
    NODISCARD bool contains(const K &key) const { return m_map.count(key) != 0; }

    void set(const K &key, V val) { m_map = std::move(m_map).set(key, std::move(val)); }

public:
    NODISCARD size_t size() const { return m_map.size(); }
    NODISCARD bool empty() const { return m_map.empty(); }

public:
    NODISCARD auto begin() const { return m_map.begin(); }
    NODISCARD auto end() const { return m_map.end(); }
};
