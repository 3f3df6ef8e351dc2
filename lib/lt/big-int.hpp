/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_BIG_INT_HPP
#define LEDGER_TURBO_BIG_INT_HPP

#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <lt/common/bytes.hpp>

namespace ledger_turbo {
    using uint128_t = boost::multiprecision::uint128_t;

    inline uint128_t uint128_max()
    {
        return std::numeric_limits<uint128_t>::max();
    }

    // the checked operations return std::nullopt instead of wrapping around
    inline std::optional<uint128_t> checked_add(const uint128_t &a, const uint128_t &b)
    {
        if (a > uint128_max() - b)
            return {};
        return a + b;
    }

    inline std::optional<uint128_t> checked_sub(const uint128_t &a, const uint128_t &b)
    {
        if (b > a)
            return {};
        return a - b;
    }

    inline std::optional<uint128_t> checked_mul(const uint128_t &a, const uint128_t &b)
    {
        if (a != 0 && b > uint128_max() / a)
            return {};
        return a * b;
    }

    // minimal big-endian representation, empty for zero
    inline uint8_vector uint128_to_bytes(const uint128_t &v)
    {
        uint8_vector res {};
        if (v != 0)
            boost::multiprecision::export_bits(v, std::back_inserter(res), 8);
        return res;
    }

    inline uint128_t uint128_from_bytes(const buffer data)
    {
        if (data.size() > 16)
            throw error("a 128-bit integer cannot have more than 16 bytes but got: {}!", data.size());
        uint128_t val {};
        for (const uint8_t b: data) {
            val <<= 8;
            val |= b;
        }
        return val;
    }

    inline uint128_t uint128_from_string(const std::string_view s)
    {
        if (s.empty() || s.size() > std::numeric_limits<uint128_t>::digits10 + 1)
            throw error("invalid 128-bit decimal: '{}'", s);
        boost::multiprecision::uint256_t val {};
        for (const char c: s) {
            if (c < '0' || c > '9')
                throw error("invalid 128-bit decimal: '{}'", s);
            val = val * 10 + static_cast<unsigned>(c - '0');
        }
        if (val > boost::multiprecision::uint256_t { uint128_max() })
            throw error("the value does not fit into 128 bits: '{}'", s);
        return static_cast<uint128_t>(val);
    }
}

namespace fmt {
    template<typename T, boost::multiprecision::expression_template_option ET>
    struct formatter<boost::multiprecision::number<T, ET>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif //LEDGER_TURBO_BIG_INT_HPP
