/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/validator.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::ledger {
    template<typename T>
    static bool has_duplicates(const vector<T> &items)
    {
        set<T> seen {};
        for (const auto &item: items) {
            if (const auto [it, created] = seen.emplace(item); !created)
                return true;
        }
        return false;
    }

    static validation_result reject(const error_kind kind, const transaction &tx)
    {
        logger::debug("transaction rejected with {}: {}", kind, tx);
        return rejected { kind };
    }

    validation_result validate(const transaction &tx, const utxo_store &store)
    {
        if (tx.inputs.empty())
            return reject(error_kind::empty_inputs, tx);
        if (tx.outputs.empty())
            return reject(error_kind::empty_outputs, tx);
        // one output can be authorized by many valid signatures, so inputs are compared by their out_points
        vector<utxo_id> out_points {};
        out_points.reserve(tx.inputs.size());
        for (const auto &in: tx.inputs)
            out_points.emplace_back(in.out_point);
        if (has_duplicates(out_points))
            return reject(error_kind::duplicate_input, tx);
        if (has_duplicates(tx.outputs))
            return reject(error_kind::duplicate_output, tx);

        const auto payload = tx.signing_payload();
        amount total_input {};
        utxo_id_set missing {};
        for (const auto &in: tx.inputs) {
            const auto prev_out = store.get(in.out_point);
            if (!prev_out) {
                missing.emplace(in.out_point);
                continue;
            }
            if (!ed25519::verify(in.sig, prev_out->owner, payload))
                return reject(error_kind::invalid_signature, tx);
            const auto sum = checked_add(total_input, prev_out->value);
            if (!sum)
                return reject(error_kind::input_overflow, tx);
            total_input = *sum;
        }

        const auto tx_bytes = tx.bytes();
        amount total_output {};
        vector<utxo_id> provides {};
        provides.reserve(tx.outputs.size());
        uint64_t out_idx = 0;
        for (const auto &out: tx.outputs) {
            if (out.value == 0)
                return reject(error_kind::zero_value_output, tx);
            const auto id = tx_output_id(tx_bytes, out_idx);
            if (store.contains(id))
                return reject(error_kind::output_collision, tx);
            const auto sum = checked_add(total_output, out.value);
            if (!sum)
                return reject(error_kind::output_overflow, tx);
            total_output = *sum;
            provides.emplace_back(id);
            if (out_idx == std::numeric_limits<uint64_t>::max())
                return reject(error_kind::index_overflow, tx);
            ++out_idx;
        }

        if (!missing.empty()) {
            logger::trace("transaction is pending on {} missing inputs: {}", missing.size(), missing);
            return pending { std::move(missing), std::move(provides) };
        }
        if (total_input < total_output)
            return reject(error_kind::insufficient_input_value, tx);
        const auto reward = checked_sub(total_input, total_output);
        if (!reward)
            return reject(error_kind::reward_underflow, tx);
        return fully_valid { std::move(provides), *reward };
    }
}
