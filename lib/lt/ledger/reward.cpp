/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/reward.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::ledger {
    distribution_result distribute(const vector<public_key> &authorities, const uint64_t block_height, utxo_store &store)
    {
        const auto pool = store.reward();
        if (authorities.empty()) {
            logger::warn("block {}: no authorities, the reward pool of {} is left undistributed", block_height, pool);
            return distribution_skipped { pool };
        }
        const amount num_authorities { authorities.size() };
        distributed res { pool, pool / num_authorities };
        const auto paid = checked_mul(res.share, num_authorities);
        if (!paid) [[unlikely]]
            throw ledger_error(error_kind::reward_overflow, "share {} times {} authorities overflows", res.share, authorities.size());
        const auto remainder = checked_sub(pool, *paid);
        if (!remainder) [[unlikely]]
            throw ledger_error(error_kind::reward_underflow, "the payout {} exceeds the reward pool {}", *paid, pool);
        if (res.share == 0) {
            res.carried = pool;
            logger::info("block {}: the reward pool of {} is too small for {} authorities and is carried over",
                block_height, pool, authorities.size());
            return res;
        }
        res.carried = *remainder;
        write_batch batch {};
        batch.reward(res.carried);
        for (const auto &vk: authorities) {
            const tx_output out { res.share, vk };
            const auto id = reward_output_id(out, block_height);
            if (store.contains(id) || batch.contains_put(id)) {
                logger::warn("block {}: the payout id {} for authority {} is already taken, the share of {} is wasted",
                    block_height, id, vk, res.share);
                res.wasted.emplace_back(vk);
                continue;
            }
            batch.put(id, out);
            res.minted.emplace_back(id);
        }
        store.apply(batch);
        logger::info("block {}: {}", block_height, distribution_result { res });
        return res;
    }
}
