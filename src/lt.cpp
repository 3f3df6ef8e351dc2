/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <lt/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace ledger_turbo;
    return cli::run(argc, argv);
}
