/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_COMMON_ERROR_HPP
#define LEDGER_TURBO_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

namespace ledger_turbo {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);

        template<typename Arg, typename... Args>
        explicit error(fmt::format_string<Arg, Args...> fmt, Arg &&a0, Args&&... a):
            error { std::string_view { fmt::format(fmt, std::forward<Arg>(a0), std::forward<Args>(a)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !LEDGER_TURBO_COMMON_ERROR_HPP
