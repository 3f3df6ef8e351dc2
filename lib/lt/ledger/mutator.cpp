/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/mutator.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::ledger {
    void commit(const transaction &tx, const fully_valid &verdict, utxo_store &store, const tx_processor_set &processors)
    {
        if (verdict.provides.size() != tx.outputs.size()) [[unlikely]]
            throw error("the verdict provides {} outputs but the transaction has {}", verdict.provides.size(), tx.outputs.size());
        write_batch batch {};
        const auto pool = checked_add(store.reward(), verdict.reward);
        if (!pool)
            throw ledger_error(error_kind::reward_overflow, "adding {} to the reward pool of {} overflows", verdict.reward, store.reward());
        batch.reward(*pool);
        for (const auto &in: tx.inputs)
            batch.remove(in.out_point);
        for (size_t i = 0; i < tx.outputs.size(); ++i)
            batch.put(verdict.provides[i], tx.outputs[i]);
        store.apply(batch);
        logger::debug("committed a transaction with reward {}: {}", verdict.reward, tx);
        for (const auto *p: processors) {
            if (p->on_tx_success)
                logger::run_log_errors([&] { p->on_tx_success(tx); });
        }
    }
}
