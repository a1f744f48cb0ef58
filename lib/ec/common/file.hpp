/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_COMMON_FILE_HPP
#define EVORE_CRANK_COMMON_FILE_HPP

#include <string>
#include "bytes.hpp"

namespace evore_crank::file {
    extern void read(const std::string &path, uint8_vector &buf);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, const buffer &data);
}

#endif // !EVORE_CRANK_COMMON_FILE_HPP
