/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include <lt/common/test.hpp>
#include <lt/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace ledger_turbo;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", res ? "failures" : "success");
    return res ? 1 : 0;
}
