/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_STORE_HPP
#define LEDGER_TURBO_LEDGER_STORE_HPP

#include <functional>
#include <optional>
#include <lt/ledger/error.hpp>
#include <lt/ledger/types.hpp>

namespace ledger_turbo::ledger {
    // A set of writes that a store applies all together or not at all.
    // Removals are applied before insertions.
    struct write_batch {
        using put_map = map<utxo_id, tx_output>;

        void put(const utxo_id &id, const tx_output &out)
        {
            if (const auto [it, created] = _puts.try_emplace(id, out); !created) [[unlikely]]
                throw ledger_error(error_kind::batch_conflict, "the batch already inserts {}", id);
        }

        void remove(const utxo_id &id)
        {
            if (const auto [it, created] = _removes.emplace(id); !created) [[unlikely]]
                throw ledger_error(error_kind::batch_conflict, "the batch already removes {}", id);
        }

        void reward(const amount &val)
        {
            _reward.emplace(val);
        }

        bool contains_put(const utxo_id &id) const
        {
            return _puts.contains(id);
        }

        const put_map &puts() const
        {
            return _puts;
        }

        const utxo_id_set &removes() const
        {
            return _removes;
        }

        const std::optional<amount> &reward() const
        {
            return _reward;
        }

        bool empty() const
        {
            return _puts.empty() && _removes.empty() && !_reward;
        }
    private:
        put_map _puts {};
        utxo_id_set _removes {};
        std::optional<amount> _reward {};
    };

    // The unspent-output set and the reward pool. Implementations own the durability of the data.
    struct utxo_store {
        using observer_type = std::function<void(const utxo_id &, const tx_output &)>;

        virtual ~utxo_store() =default;

        [[nodiscard]] std::optional<tx_output> get(const utxo_id &id) const
        {
            return _get_impl(id);
        }

        [[nodiscard]] bool contains(const utxo_id &id) const
        {
            return _get_impl(id).has_value();
        }

        [[nodiscard]] size_t size() const
        {
            return _size_impl();
        }

        [[nodiscard]] amount reward() const
        {
            return _reward_impl();
        }

        void foreach(const observer_type &observer) const
        {
            _foreach_impl(observer);
        }

        // Throws ledger_error(batch_conflict) without touching the state when a removed id is missing
        // or an inserted id is already present.
        void apply(const write_batch &batch)
        {
            _apply_impl(batch);
        }

        void put(const utxo_id &id, const tx_output &out)
        {
            write_batch batch {};
            batch.put(id, out);
            apply(batch);
        }

        void remove(const utxo_id &id)
        {
            write_batch batch {};
            batch.remove(id);
            apply(batch);
        }

        void reward(const amount &val)
        {
            write_batch batch {};
            batch.reward(val);
            apply(batch);
        }

        amount take_reward()
        {
            const auto val = reward();
            reward(0);
            return val;
        }
    private:
        virtual std::optional<tx_output> _get_impl(const utxo_id &id) const =0;
        virtual size_t _size_impl() const =0;
        virtual amount _reward_impl() const =0;
        virtual void _foreach_impl(const observer_type &observer) const =0;
        virtual void _apply_impl(const write_batch &batch) =0;
    };

    struct memory_store: utxo_store {
        using utxo_map = map<utxo_id, tx_output>;

        bool operator==(const memory_store &o) const
        {
            return _utxos == o._utxos && _reward == o._reward;
        }
    private:
        utxo_map _utxos {};
        amount _reward {};

        std::optional<tx_output> _get_impl(const utxo_id &id) const override;
        size_t _size_impl() const override;
        amount _reward_impl() const override;
        void _foreach_impl(const observer_type &observer) const override;
        void _apply_impl(const write_batch &batch) override;
    };
}

#endif // !LEDGER_TURBO_LEDGER_STORE_HPP
