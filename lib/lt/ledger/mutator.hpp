/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_MUTATOR_HPP
#define LEDGER_TURBO_LEDGER_MUTATOR_HPP

#include <functional>
#include <lt/ledger/validator.hpp>

namespace ledger_turbo::ledger {
    struct tx_processor {
        std::function<void(const transaction &)> on_tx_success {};
    };
    using tx_processor_set = set<const tx_processor *>;

    // Applies the effects of a fully valid transaction in one write batch.
    // Throws ledger_error and leaves the store untouched if the reward pool overflows
    // or if the verdict no longer matches the store.
    // The processors are notified after the batch is applied; their failures are logged and do not undo the commit.
    extern void commit(const transaction &tx, const fully_valid &verdict, utxo_store &store, const tx_processor_set &processors={});
}

#endif // !LEDGER_TURBO_LEDGER_MUTATOR_HPP
