/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_VALIDATOR_HPP
#define LEDGER_TURBO_LEDGER_VALIDATOR_HPP

#include <variant>
#include <lt/ledger/error.hpp>
#include <lt/ledger/store.hpp>

namespace ledger_turbo::ledger {
    // every input resolved and verified; provides lists output ids in the order of the outputs
    struct fully_valid {
        vector<utxo_id> provides {};
        amount reward {};

        bool operator==(const fully_valid &o) const =default;
    };

    // at least one input references an output that is not in the store yet
    struct pending {
        utxo_id_set required {};
        vector<utxo_id> provides {};

        bool operator==(const pending &o) const =default;
    };

    struct rejected {
        error_kind kind {};

        bool operator==(const rejected &o) const =default;
    };

    using validation_result = std::variant<fully_valid, pending, rejected>;

    // Does not modify the store. The checks run in a fixed order and the first failing one determines the result.
    extern validation_result validate(const transaction &tx, const utxo_store &store);
}

namespace fmt {
    template<>
    struct formatter<ledger_turbo::ledger::validation_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace ledger_turbo::ledger;
            if (const auto *ok = std::get_if<fully_valid>(&v))
                return fmt::format_to(ctx.out(), "fully_valid reward: {} provides: {}", ok->reward, ok->provides);
            if (const auto *pend = std::get_if<pending>(&v))
                return fmt::format_to(ctx.out(), "pending required: {} provides: {}", pend->required, pend->provides);
            return fmt::format_to(ctx.out(), "rejected: {}", std::get<rejected>(v).kind);
        }
    };
}

#endif // !LEDGER_TURBO_LEDGER_VALIDATOR_HPP
