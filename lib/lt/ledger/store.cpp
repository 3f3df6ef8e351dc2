/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/store.hpp>

namespace ledger_turbo::ledger {
    std::optional<tx_output> memory_store::_get_impl(const utxo_id &id) const
    {
        if (const auto it = _utxos.find(id); it != _utxos.end())
            return it->second;
        return {};
    }

    size_t memory_store::_size_impl() const
    {
        return _utxos.size();
    }

    amount memory_store::_reward_impl() const
    {
        return _reward;
    }

    void memory_store::_foreach_impl(const observer_type &observer) const
    {
        for (const auto &[id, out]: _utxos)
            observer(id, out);
    }

    void memory_store::_apply_impl(const write_batch &batch)
    {
        for (const auto &id: batch.removes()) {
            if (!_utxos.contains(id)) [[unlikely]]
                throw ledger_error(error_kind::batch_conflict, "cannot remove a missing utxo {}", id);
        }
        // the new nodes are allocated before the first change so that a failed allocation leaves the state intact
        utxo_map new_utxos {};
        for (const auto &[id, out]: batch.puts()) {
            if (_utxos.contains(id) && !batch.removes().contains(id)) [[unlikely]]
                throw ledger_error(error_kind::batch_conflict, "cannot insert an already present utxo {}", id);
            new_utxos.emplace_hint(new_utxos.end(), id, out);
        }
        for (const auto &id: batch.removes())
            _utxos.erase(id);
        _utxos.merge(new_utxos);
        if (batch.reward())
            _reward = *batch.reward();
    }
}
