/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */
#ifndef LEDGER_TURBO_COMMON_TEST_HPP
#define LEDGER_TURBO_COMMON_TEST_HPP

#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <lt/array.hpp>
#include <lt/common/error.hpp>
#include <lt/file.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            using value_type = std::decay_t<T>;
            if constexpr (std::is_same_v<value_type, buffer> || std::is_same_v<value_type, uint8_vector>
                    || std::is_same_v<value_type, byte_array<32>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    void test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        expect(x == static_cast<T>(y), loc) << fmt::format("{} != {}", x, y);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<ledger_turbo::test_printer>> {};

#endif // !LEDGER_TURBO_COMMON_TEST_HPP
