/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_LEDGER_ERROR_HPP
#define LEDGER_TURBO_LEDGER_ERROR_HPP

#include <lt/common/error.hpp>
#include <lt/common/format.hpp>

namespace ledger_turbo::ledger {
    enum class error_kind: uint8_t {
        empty_inputs,
        empty_outputs,
        duplicate_input,
        duplicate_output,
        invalid_signature,
        zero_value_output,
        output_collision,
        insufficient_input_value,
        input_overflow,
        output_overflow,
        reward_underflow,
        index_overflow,
        reward_overflow,
        batch_conflict
    };

    struct ledger_error: error {
        template<typename... Args>
        explicit ledger_error(const error_kind kind, fmt::format_string<Args...> fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt, std::forward<Args>(a)...) } }, _kind { kind }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };
}

namespace fmt {
    template<>
    struct formatter<ledger_turbo::ledger::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ledger_turbo::ledger::error_kind;
            switch (v) {
                case error_kind::empty_inputs: return fmt::format_to(ctx.out(), "empty_inputs");
                case error_kind::empty_outputs: return fmt::format_to(ctx.out(), "empty_outputs");
                case error_kind::duplicate_input: return fmt::format_to(ctx.out(), "duplicate_input");
                case error_kind::duplicate_output: return fmt::format_to(ctx.out(), "duplicate_output");
                case error_kind::invalid_signature: return fmt::format_to(ctx.out(), "invalid_signature");
                case error_kind::zero_value_output: return fmt::format_to(ctx.out(), "zero_value_output");
                case error_kind::output_collision: return fmt::format_to(ctx.out(), "output_collision");
                case error_kind::insufficient_input_value: return fmt::format_to(ctx.out(), "insufficient_input_value");
                case error_kind::input_overflow: return fmt::format_to(ctx.out(), "input_overflow");
                case error_kind::output_overflow: return fmt::format_to(ctx.out(), "output_overflow");
                case error_kind::reward_underflow: return fmt::format_to(ctx.out(), "reward_underflow");
                case error_kind::index_overflow: return fmt::format_to(ctx.out(), "index_overflow");
                case error_kind::reward_overflow: return fmt::format_to(ctx.out(), "reward_overflow");
                case error_kind::batch_conflict: return fmt::format_to(ctx.out(), "batch_conflict");
                default: throw ledger_turbo::error("unsupported error_kind value: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !LEDGER_TURBO_LEDGER_ERROR_HPP
