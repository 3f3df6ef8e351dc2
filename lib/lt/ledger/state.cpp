/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/ledger/state.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::ledger {
    validation_result state::spend(const transaction &tx)
    {
        auto res = validate(tx, _store);
        if (const auto *ok = std::get_if<fully_valid>(&res)) {
            commit(tx, *ok, _store, _processors);
            ++_num_committed;
        }
        return res;
    }

    distribution_result state::finalize(const vector<public_key> &authorities, const uint64_t block_height)
    {
        logger::debug("finalizing block {} with {} authorities after {} committed transactions",
            block_height, authorities.size(), _num_committed);
        return distribute(authorities, block_height, _store);
    }
}
