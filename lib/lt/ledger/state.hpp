/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_STATE_HPP
#define LEDGER_TURBO_LEDGER_STATE_HPP

#include <lt/ledger/genesis.hpp>
#include <lt/ledger/mutator.hpp>
#include <lt/ledger/reward.hpp>

namespace ledger_turbo::ledger {
    // Per-block entry point: transactions are submitted one at a time with spend and each block ends with finalize.
    struct state {
        explicit state(utxo_store &store): _store { store }
        {
        }

        void register_processor(const tx_processor &p)
        {
            _processors.emplace(&p);
        }

        void remove_processor(const tx_processor &p)
        {
            _processors.erase(&p);
        }

        void seed(const genesis &g)
        {
            g.seed(_store);
        }

        // commits the transaction if and only if the returned verdict is fully_valid
        validation_result spend(const transaction &tx);

        distribution_result finalize(const vector<public_key> &authorities, uint64_t block_height);

        const utxo_store &utxos() const
        {
            return _store;
        }

        amount reward() const
        {
            return _store.reward();
        }

        uint64_t num_committed() const
        {
            return _num_committed;
        }
    private:
        utxo_store &_store;
        tx_processor_set _processors {};
        uint64_t _num_committed = 0;
    };
}

#endif // !LEDGER_TURBO_LEDGER_STATE_HPP
