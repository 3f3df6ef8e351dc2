/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_FIXTURE_HPP
#define LEDGER_TURBO_LEDGER_FIXTURE_HPP

#include <lt/common/test.hpp>
#include <lt/ledger/state.hpp>

namespace ledger_turbo::ledger::fixture {
    struct key_pair {
        ed25519::skey sk {};
        public_key vk {};

        explicit key_pair(const std::string_view name)
        {
            ed25519::create_from_seed(sk, vk, blake2b<ed25519::seed>(name));
        }
    };

    // a store with a single genesis output, returns its id
    inline utxo_id seed_one(utxo_store &store, const amount &value, const public_key &owner)
    {
        const tx_output out { value, owner };
        const auto id = genesis_output_id(out);
        store.put(id, out);
        return id;
    }

    // signs every input with a single key
    inline transaction make_tx(const vector<utxo_id> &ins, const tx_output_list &outs, const key_pair &signer)
    {
        transaction tx {};
        for (const auto &id: ins)
            tx.inputs.emplace_back(tx_input { id });
        tx.outputs = outs;
        const auto sig = tx.sign(signer.sk);
        for (auto &in: tx.inputs)
            in.sig = sig;
        return tx;
    }

    inline error_kind error_kind_of(const std::function<void()> &action)
    {
        try {
            action();
        } catch (const ledger_error &ex) {
            return ex.kind();
        }
        throw error("the action did not throw a ledger_error");
    }

    inline utxo_id_set snapshot_ids(const utxo_store &store)
    {
        utxo_id_set ids {};
        store.foreach([&](const auto &id, const auto &) {
            ids.emplace(id);
        });
        return ids;
    }
}

#endif // !LEDGER_TURBO_LEDGER_FIXTURE_HPP
