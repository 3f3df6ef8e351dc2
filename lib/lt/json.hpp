/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_JSON_HPP
#define LEDGER_TURBO_JSON_HPP

#include <boost/json.hpp>
#include <lt/big-int.hpp>
#include <lt/file.hpp>

namespace ledger_turbo::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // 128-bit amounts do not fit JSON numbers, so they are accepted both as numbers and decimal strings
    inline uint128_t value_to_uint128(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::uint64: return v.get_uint64();
            case json::kind::int64: {
                if (v.get_int64() < 0)
                    throw error("a negative value where an unsigned amount is expected: {}", v.get_int64());
                return static_cast<uint64_t>(v.get_int64());
            }
            case json::kind::string: return uint128_from_string(static_cast<std::string_view>(v.get_string()));
            default: throw error("unsupported json value kind for an amount: {}", static_cast<int>(v.kind()));
        }
    }
}

#endif // !LEDGER_TURBO_JSON_HPP
