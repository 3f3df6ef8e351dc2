/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli/common.hpp>

namespace ledger_turbo::cli::keygen {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "keygen";
            cmd.desc = "derive an ed25519 key pair from a seed text";
            cmd.args = { "<seed-text>" };
        }

        void run(const parse_result &pr) const override
        {
            const auto [sk, vk] = common::key_from_text(pr.args.at(0));
            std::cout << fmt::format("secret key: {}\npublic key: {}\n", sk, vk);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
