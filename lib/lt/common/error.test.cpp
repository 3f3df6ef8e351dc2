/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <optional>
#include <lt/common/test.hpp>
#include <lt/ledger/error.hpp>

using namespace ledger_turbo;

template<typename F>
void expect_throws_msg(const F &f, const std::string_view matches, const std::source_location &src_loc=std::source_location::current())
{
    expect(boost::ut::throws<error>(f)) << "no exception has been thrown";
    std::optional<std::string> msg {};
    try {
        f();
    } catch (const error &ex) {
        msg = ex.what();
    }
    expect(static_cast<bool>(msg)) << "exception message is empty";
    if (msg)
        expect(msg->starts_with(matches)) << fmt::format("'{}' does not start with '{}' from {}:{}", *msg, matches, src_loc.file_name(), src_loc.line());
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
        };
        "format args"_test = [] {
            expect_throws_msg([] { throw error("Hello {} and {}!", 123, "abc"); }, "Hello 123 and abc!");
        };
        "nested"_test = [] {
            expect_throws_msg([] {
                try {
                    throw std::runtime_error("inner");
                } catch (const std::exception &ex) {
                    throw error("outer", ex);
                }
            }, "outer caused by");
        };
        "error_sys"_test = [] {
            expect_throws_msg([] { throw error_sys("a system call failed"); }, "a system call failed errno: ");
        };
        "ledger_error"_test = [] {
            using namespace ledger_turbo::ledger;
            expect_throws_msg([] { throw ledger_error(error_kind::reward_overflow, "pool {} overflows", 7); }, "pool 7 overflows");
            try {
                throw ledger_error(error_kind::batch_conflict, "conflict");
            } catch (const ledger_error &ex) {
                test_same(error_kind::batch_conflict, ex.kind());
            }
            test_same(std::string { "insufficient_input_value" }, fmt::format("{}", error_kind::insufficient_input_value));
        };
    };
};
