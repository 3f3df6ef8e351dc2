/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli/common.hpp>
#include <lt/ledger/genesis.hpp>

namespace ledger_turbo::cli::genesis {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "genesis";
            cmd.desc = "load a genesis configuration and show the initial utxo set";
            cmd.args = { "<genesis.json>" };
        }

        void run(const parse_result &pr) const override
        {
            const auto g = ledger::genesis::from_config(config_file { pr.args.at(0) });
            ledger::memory_store store {};
            g.seed(store);
            common::print_utxos(store);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
