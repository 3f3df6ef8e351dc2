/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_CBOR_TYPES_HPP
#define LEDGER_TURBO_CBOR_TYPES_HPP

#include <cstdint>

namespace ledger_turbo::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    // RFC 8949 section 3.4.3
    static constexpr uint64_t tag_positive_bignum = 2;
}

#endif // !LEDGER_TURBO_CBOR_TYPES_HPP
