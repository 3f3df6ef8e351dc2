/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/config.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo {
    static json::object load_object(const std::string &path)
    {
        auto jv = json::load(path);
        if (!jv.is_object())
            throw error("configuration file {} must contain a JSON object!", path);
        logger::debug("loaded configuration from {}", path);
        return std::move(jv.as_object());
    }

    config_file::config_file(const std::string &path)
            : _path { path }, _parsed { load_object(path) }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error("configuration file {} does not have the element {}!", _path, name);
        return it->value();
    }
}
