#pragma once
#ifndef LEDGER_TURBO_BLAKE2B_HPP
#define LEDGER_TURBO_BLAKE2B_HPP
/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/array.hpp>
#include <lt/common/bytes.hpp>

namespace ledger_turbo {
    using blake2b_256_hash = byte_array<32>;

    extern void blake2b_sodium(void *out, size_t out_len, const void *in, size_t in_len);

    inline void blake2b(const std::span<uint8_t> &out, const buffer &in)
    {
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
    }

    template<typename T>
    T blake2b(const buffer &in)
    {
        T out;
        blake2b_sodium(out.data(), out.size(), in.data(), in.size());
        return out;
    }
}

#endif // !LEDGER_TURBO_BLAKE2B_HPP
