/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli.hpp>

namespace ledger_turbo::cli {
    static std::string usage(const config &cfg)
    {
        std::string res = fmt::format("usage: {}", cfg.make_usage());
        if (!cfg.opts.empty()) {
            res += fmt::format("\n{} supports the following options:", cfg.name);
            for (const auto &[name, opt]: cfg.opts) {
                if (opt.default_value)
                    res += fmt::format("\n    --{} ({} by default) - {}", name, *opt.default_value, opt.desc);
                else
                    res += fmt::format("\n    --{} - {}", name, opt.desc);
            }
        }
        return res;
    }

    parse_result command::parse(const config &cfg, const arguments &args)
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (arg.starts_with("--")) {
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                if (!cfg.opts.contains(name))
                    throw error("unknown option '--{}'\n{}", name, usage(cfg));
                if (const auto [it, created] = pr.opts.try_emplace(name, std::move(val)); !created)
                    throw error("duplicate option specification '{}'", arg);
            } else {
                pr.args.emplace_back(arg);
            }
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (opt.default_value && !pr.opts.contains(name))
                pr.opts.emplace(name, *opt.default_value);
        }
        if (pr.args.size() != cfg.args.size())
            throw error(usage(cfg));
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        map<std::string, std::pair<std::shared_ptr<command>, config>> commands {};
        for (const auto &cmd: command_list) {
            config cfg {};
            cmd->configure(cfg);
            const auto name = cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, cmd, std::move(cfg)); !created) [[unlikely]]
                throw error("multiple definitions for {}", name);
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {}\n", meta.second.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &[impl, cfg] = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::info };
            impl->run(command::parse(cfg, args));
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
