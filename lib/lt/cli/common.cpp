/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli/common.hpp>

namespace ledger_turbo::cli::common {
    std::pair<ed25519::skey, ed25519::vkey> key_from_text(const std::string_view text)
    {
        if (text.empty())
            throw error("the key seed text must not be empty");
        const auto sd = blake2b<ed25519::seed>(text);
        return ed25519::create_from_seed(sd);
    }

    void print_utxos(const ledger::utxo_store &store)
    {
        ledger::amount total {};
        store.foreach([&](const auto &id, const auto &out) {
            std::cout << fmt::format("{}: {}\n", id, out);
            const auto sum = checked_add(total, out.value);
            if (!sum)
                throw error("the total value of the utxo set overflows at {}", id);
            total = *sum;
        });
        std::cout << fmt::format("utxos: {} total value: {} reward pool: {}\n", store.size(), total, store.reward());
    }
}
