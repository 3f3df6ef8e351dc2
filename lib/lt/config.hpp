/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_CONFIG_HPP
#define LEDGER_TURBO_CONFIG_HPP

#include <lt/json.hpp>

namespace ledger_turbo {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error("Config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };
}

#endif // !LEDGER_TURBO_CONFIG_HPP
