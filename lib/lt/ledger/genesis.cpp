/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/genesis.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::ledger {
    genesis genesis::from_config(const config &cfg)
    {
        genesis g {};
        for (const auto &j_out: cfg.at("utxos").as_array())
            g.utxos.emplace_back(tx_output::from_json(j_out));
        return g;
    }

    map<utxo_id, tx_output> genesis::outputs() const
    {
        map<utxo_id, tx_output> res {};
        for (const auto &out: utxos) {
            const auto id = genesis_output_id(out);
            if (const auto [it, created] = res.try_emplace(id, out); !created)
                throw error("genesis contains a duplicate output {} with id {}", out, id);
        }
        return res;
    }

    amount genesis::total_value() const
    {
        amount total {};
        for (const auto &out: utxos) {
            const auto sum = checked_add(total, out.value);
            if (!sum)
                throw ledger_error(error_kind::output_overflow, "the total genesis value overflows at {}", out);
            total = *sum;
        }
        return total;
    }

    void genesis::seed(utxo_store &store) const
    {
        const auto total = total_value();
        write_batch batch {};
        for (const auto &[id, out]: outputs()) {
            logger::trace("genesis utxo {}: {}", id, out);
            batch.put(id, out);
        }
        store.apply(batch);
        logger::info("seeded {} genesis utxos with the total value {}", utxos.size(), total);
    }
}
