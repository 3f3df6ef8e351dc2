/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_REWARD_HPP
#define LEDGER_TURBO_LEDGER_REWARD_HPP

#include <variant>
#include <lt/ledger/store.hpp>

namespace ledger_turbo::ledger {
    struct distributed {
        amount pool {};
        amount share {};
        // the value left in the pool for the next round
        amount carried {};
        vector<utxo_id> minted {};
        vector<public_key> wasted {};

        bool operator==(const distributed &o) const =default;
    };

    // the authority set is empty so the pool is left as is
    struct distribution_skipped {
        amount pool {};

        bool operator==(const distribution_skipped &o) const =default;
    };

    using distribution_result = std::variant<distributed, distribution_skipped>;

    // Splits the reward pool evenly among the authorities and mints one output per authority.
    // The remainder of the division stays in the pool. When the pool is smaller than the number of authorities
    // nothing is minted and the whole pool is carried. An authority whose payout id is already taken gets nothing.
    extern distribution_result distribute(const vector<public_key> &authorities, uint64_t block_height, utxo_store &store);
}

namespace fmt {
    template<>
    struct formatter<ledger_turbo::ledger::distribution_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_turbo::ledger;
            if (const auto *skip = std::get_if<distribution_skipped>(&v))
                return fmt::format_to(ctx.out(), "distribution skipped, pool: {}", skip->pool);
            const auto &res = std::get<distributed>(v);
            return fmt::format_to(ctx.out(), "distributed pool: {} share: {} carried: {} minted: {} wasted: {}",
                res.pool, res.share, res.carried, res.minted.size(), res.wasted.size());
        }
    };
}

#endif // !LEDGER_TURBO_LEDGER_REWARD_HPP
