/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/common/test.hpp>
#include <lt/blake2b.hpp>
#include <lt/ed25519.hpp>

using namespace ledger_turbo;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        static const auto seed = ed25519::seed::from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
        static const auto exp_vk = ed25519::vkey::from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
        static const auto exp_sig = ed25519::signature::from_hex(
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
        "rfc8032 test vector"_test = [] {
            const auto [sk, vk] = ed25519::create_from_seed(seed);
            test_same(exp_vk, vk);
            test_same(exp_vk, ed25519::extract_vk(sk));
            const auto sig = ed25519::sign(uint8_vector {}, sk);
            test_same(exp_sig, sig);
            expect(ed25519::verify(sig, vk, uint8_vector {}));
        };
        "create-sign-verify"_test = [] {
            const auto [sk1, vk1] = ed25519::create_from_seed(blake2b<ed25519::seed>(std::string_view { "1" }));
            const auto [sk2, vk2] = ed25519::create_from_seed(blake2b<ed25519::seed>(std::string_view { "2" }));
            expect(vk1 != vk2);
            const std::string msg1 { "message1" }, msg2 { "message2" };
            const auto sig11 = ed25519::sign(msg1, sk1);
            const auto sig12 = ed25519::sign(msg2, sk1);
            const auto sig21 = ed25519::sign(msg1, sk2);
            expect(sig11 != sig12);
            expect(sig11 != sig21);
            expect(ed25519::verify(sig11, vk1, msg1));
            expect(!ed25519::verify(sig11, vk2, msg1));
            expect(!ed25519::verify(sig11, vk1, msg2));
            expect(ed25519::verify(sig12, vk1, msg2));
            expect(ed25519::verify(sig21, vk2, msg1));
            expect(!ed25519::verify(sig21, vk1, msg1));
        };
        "non-canonical signature"_test = [] {
            // the group order L in little-endian byte order
            static const auto order = byte_array<32>::from_hex("edd3f55c1a631258d69cf7a2def9de1400000000000000000000000000000010");
            auto malleated = exp_sig;
            unsigned carry = 0;
            for (size_t i = 0; i < order.size(); ++i) {
                const unsigned sum = malleated[32 + i] + order[i] + carry;
                malleated[32 + i] = static_cast<uint8_t>(sum & 0xFF);
                carry = sum >> 8;
            }
            expect(carry == 0U);
            expect(malleated != exp_sig);
            expect(ed25519::verify(exp_sig, exp_vk, uint8_vector {}));
            expect(!ed25519::verify(malleated, exp_vk, uint8_vector {}));
        };
        "invalid sizes"_test = [] {
            const auto [sk, vk] = ed25519::create_from_seed(seed);
            expect(throws([&] { ed25519::verify(uint8_vector(63), vk, uint8_vector {}); }));
            expect(throws([&] { ed25519::sign(uint8_vector {}, uint8_vector(32)); }));
            expect(throws([&] { ed25519::create_from_seed(uint8_vector(31)); }));
        };
    };
};
