/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli/common.hpp>
#include <lt/ledger/types.hpp>

namespace ledger_turbo::cli::sign {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sign";
            cmd.desc = "sign the inputs of a JSON transaction and print the signed transaction";
            cmd.args = { "<tx.json>", "<seed-text>" };
            cmd.opts.try_emplace("input", "sign only the input with the given index, all inputs by default");
        }

        void run(const parse_result &pr) const override
        {
            auto tx = ledger::transaction::from_json(json::load(pr.args.at(0)));
            const auto [sk, vk] = common::key_from_text(pr.args.at(1));
            const auto sig = tx.sign(sk);
            if (const auto it = pr.opts.find("input"); it != pr.opts.end()) {
                if (!it->second)
                    throw error("the --input option requires a value");
                tx.inputs.at(std::stoull(*it->second)).sig = sig;
            } else {
                for (auto &in: tx.inputs)
                    in.sig = sig;
            }
            logger::info("signed with the key {}", vk);
            std::cout << json::serialize(tx.to_json()) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
