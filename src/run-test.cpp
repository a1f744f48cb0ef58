/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#include <iostream>
#include <ec/common/test.hpp>
#include <ec/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace evore_crank;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
