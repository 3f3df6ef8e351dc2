/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli/common.hpp>
#include <lt/ledger/state.hpp>

namespace ledger_turbo::cli::replay {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "replay";
            cmd.desc = "apply a sequence of blocks to the genesis state and show the resulting utxo set";
            cmd.args = { "<genesis.json>", "<blocks.json>" };
            cmd.opts.try_emplace("strict", "fail on the first transaction that is not fully valid");
        }

        void run(const parse_result &pr) const override
        {
            const bool strict = pr.has("strict");
            ledger::memory_store store {};
            ledger::state st { store };
            st.seed(ledger::genesis::from_config(config_file { pr.args.at(0) }));
            uint64_t num_txs = 0;
            const ledger::tx_processor counter {
                .on_tx_success = [&](const auto &) { ++num_txs; }
            };
            st.register_processor(counter);
            const auto blocks = json::load(pr.args.at(1));
            for (const auto &j_block: blocks.as_array()) {
                const auto &block = j_block.as_object();
                const auto height = json::value_to<uint64_t>(block.at("height"));
                const auto &txs = block.at("txs").as_array();
                for (size_t i = 0; i < txs.size(); ++i) {
                    const auto tx = ledger::transaction::from_json(txs.at(i));
                    const auto res = st.spend(tx);
                    std::cout << fmt::format("block {} tx #{}: {}\n", height, i, res);
                    if (strict && !std::holds_alternative<ledger::fully_valid>(res))
                        throw error("block {} tx #{} is not fully valid: {}", height, i, res);
                }
                vector<ledger::public_key> authorities {};
                for (const auto &j_vk: block.at("authorities").as_array())
                    authorities.emplace_back(ledger::public_key::from_hex(static_cast<std::string_view>(j_vk.as_string())));
                std::cout << fmt::format("block {} finalized: {}\n", height, st.finalize(authorities, height));
            }
            st.remove_processor(counter);
            logger::info("replayed {} blocks with {} committed transactions", blocks.as_array().size(), num_txs);
            common::print_utxos(store);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
