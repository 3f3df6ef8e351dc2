/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_FILE_HPP
#define LEDGER_TURBO_FILE_HPP

#include <filesystem>
#include <string>
#include <lt/common/bytes.hpp>

namespace ledger_turbo::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, const buffer &data);

    // a file path in the system's temporary directory that is removed when the object goes out of scope
    struct tmp {
        explicit tmp(const std::string &name);
        ~tmp();

        const std::string &path() const
        {
            return _path;
        }

        operator const std::string &() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !LEDGER_TURBO_FILE_HPP
