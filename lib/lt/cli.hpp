/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_CLI_HPP
#define LEDGER_TURBO_CLI_HPP

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <lt/container.hpp>
#include <lt/logger.hpp>
#include <lt/timer.hpp>

namespace ledger_turbo::cli {
    using arguments = vector<std::string>;
    using options = map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
    };
    using option_config_map = map<std::string, option_config>;

    struct config {
        std::string name {};
        std::string desc {};
        vector<std::string> args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &arg: args)
                arg_info += fmt::format(" {}", arg);
            const std::string opt_info { opts.empty() ? "" : " [options]" };
            return fmt::format("{}{}{} - {}", name, opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};

        bool has(const std::string &name) const
        {
            return opts.contains(name);
        }
    };

    struct command {
        using command_list = vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        virtual void run(const parse_result &pr) const =0;

        // positional arguments must match cfg.args exactly, options must be declared in cfg.opts
        static parse_result parse(const config &cfg, const arguments &args);
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !LEDGER_TURBO_CLI_HPP
