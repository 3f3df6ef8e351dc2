/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

extern "C" {
#   include <sodium.h>
}
#include <lt/blake2b.hpp>
#include <lt/ed25519.hpp>

namespace ledger_turbo {
    static_assert(sizeof(blake2b_256_hash) == crypto_generichash_BYTES);

    void blake2b_sodium(void *out, const size_t out_len, const void *in, const size_t in_len)
    {
        ed25519::ensure_initialized();
        if (crypto_generichash(reinterpret_cast<unsigned char*>(out), out_len, reinterpret_cast<const unsigned char *>(in), in_len, nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }

    void secure_clear(std::span<uint8_t> store)
    {
        sodium_memzero(store.data(), store.size());
    }
}
