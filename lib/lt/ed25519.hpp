/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_ED25519_HPP
#define LEDGER_TURBO_ED25519_HPP

#include <utility>
#include <lt/array.hpp>

namespace ledger_turbo::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using signature = byte_array<64>;
    using seed = secure_byte_array<32>;

    extern void ensure_initialized();
    extern void create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &sd);
    extern std::pair<skey, vkey> create_from_seed(const buffer &seed);
    extern vkey extract_vk(const buffer &sk);
    extern void sign(const std::span<uint8_t> &sig, const buffer &msg, const buffer &sk);
    extern signature sign(const buffer &msg, const buffer &sk);
    // strict verification: non-canonical signatures and small-order keys are rejected
    extern bool verify(const buffer &sig, const buffer &vk, const buffer &msg);
}

#endif // !LEDGER_TURBO_ED25519_HPP
