/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_CLI_COMMON_HPP
#define LEDGER_TURBO_CLI_COMMON_HPP

#include <lt/cli.hpp>
#include <lt/ledger/store.hpp>

namespace ledger_turbo::cli::common {
    // a deterministic key pair derived from the blake2b-256 hash of a text
    extern std::pair<ed25519::skey, ed25519::vkey> key_from_text(std::string_view text);
    extern void print_utxos(const ledger::utxo_store &store);
}

#endif // !LEDGER_TURBO_CLI_COMMON_HPP
