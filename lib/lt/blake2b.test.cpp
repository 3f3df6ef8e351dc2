/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/common/test.hpp>
#include <lt/blake2b.hpp>

using namespace ledger_turbo;

suite blake2b_suite = [] {
    "blake2b"_test = [] {
        "test vectors"_test = [] {
            using test_vector = std::pair<std::string, std::string>;
            static vector<test_vector> test_vectors = {
                test_vector { "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", "" },
                test_vector { "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319", "abc" }
            };
            for (const auto &[exp_hash, input]: test_vectors) {
                const auto exp_hash_bin = uint8_vector::from_hex(exp_hash);
                const auto hash = blake2b<blake2b_256_hash>(input);
                test_same(static_cast<buffer>(exp_hash_bin), static_cast<buffer>(hash));
            }
        };
        "span output"_test = [] {
            blake2b_256_hash out {};
            blake2b(out, std::string_view { "abc" });
            test_same(blake2b<blake2b_256_hash>(std::string_view { "abc" }), out);
        };
    };
};
