/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_GENESIS_HPP
#define LEDGER_TURBO_LEDGER_GENESIS_HPP

#include <lt/config.hpp>
#include <lt/ledger/store.hpp>

namespace ledger_turbo::ledger {
    struct genesis {
        // expects { "utxos": [ { "value": ..., "owner": "hex" }, ... ] }
        static genesis from_config(const config &cfg);

        tx_output_list utxos {};

        // genesis id -> output; two identical outputs are refused since they would share an id
        map<utxo_id, tx_output> outputs() const;
        amount total_value() const;
        // inserts all outputs in one batch; fails if any of the ids is already present
        void seed(utxo_store &store) const;
    };
}

#endif // !LEDGER_TURBO_LEDGER_GENESIS_HPP
