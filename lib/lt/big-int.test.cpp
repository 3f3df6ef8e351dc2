/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/common/test.hpp>
#include <lt/big-int.hpp>

using namespace ledger_turbo;

suite big_int_suite = [] {
    "big_int"_test = [] {
        "checked arithmetic"_test = [] {
            const auto max = uint128_max();
            expect(!checked_add(max, uint128_t { 1 }));
            test_same(max, *checked_add(max - 1, uint128_t { 1 }));
            expect(!checked_sub(uint128_t { 1 }, uint128_t { 2 }));
            test_same(uint128_t { 0 }, *checked_sub(uint128_t { 2 }, uint128_t { 2 }));
            expect(!checked_mul(max / 2 + 1, uint128_t { 2 }));
            test_same(uint128_t { 30 }, *checked_mul(uint128_t { 10 }, uint128_t { 3 }));
            test_same(uint128_t { 0 }, *checked_mul(uint128_t { 0 }, max));
        };
        "bytes"_test = [] {
            test_same(size_t { 0 }, uint128_to_bytes(0).size());
            test_same(uint8_vector::from_hex("0100"), uint128_to_bytes(256));
            test_same(size_t { 16 }, uint128_to_bytes(uint128_max()).size());
            test_same(uint128_max(), uint128_from_bytes(uint128_to_bytes(uint128_max())));
            expect(throws([] { uint128_from_bytes(uint8_vector(17)); }));
        };
        "decimal strings"_test = [] {
            test_same(uint128_max(), uint128_from_string("340282366920938463463374607431768211455"));
            test_same(std::string { "340282366920938463463374607431768211455" }, fmt::format("{}", uint128_max()));
            test_same(uint128_t { 12345 }, uint128_from_string("12345"));
            expect(throws([] { uint128_from_string("340282366920938463463374607431768211456"); }));
            expect(throws([] { uint128_from_string(""); }));
            expect(throws([] { uint128_from_string("-1"); }));
            expect(throws([] { uint128_from_string("12a"); }));
        };
    };
};
