#pragma once
#ifndef LEDGER_TURBO_CONTAINER_HPP
#define LEDGER_TURBO_CONTAINER_HPP
/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <lt/common/format.hpp>

namespace ledger_turbo {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    template<typename K>
    struct flat_set: boost::container::flat_set<K> {
        using base_type = boost::container::flat_set<K>;
        using base_type::base_type;

        const typename base_type::value_type &at(const size_t idx) const
        {
            if (idx >= base_type::size()) [[unlikely]]
                throw error("flat_set index out of range: {} >= {}", idx, base_type::size());
            auto it = base_type::cbegin() + idx;
            return *it;
        }
    };
}

namespace fmt {
    template<typename T>
    struct formatter<ledger_turbo::flat_set<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}{}", *it, sep);
            }
            return fmt::format_to(out_it, "]");
        }
    };
}

#endif //!LEDGER_TURBO_CONTAINER_HPP
