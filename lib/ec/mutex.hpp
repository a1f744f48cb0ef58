/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_MUTEX_HPP
#define EVORE_CRANK_MUTEX_HPP

#include <mutex>
#include <new>

namespace evore_crank::mutex {
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Winterference-size"
#   endif
#endif
#   ifdef __cpp_lib_hardware_interference_size
        static constexpr size_t padding = std::hardware_destructive_interference_size;
#   else
        static constexpr size_t padding = 64;
#   endif
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

    using scoped_lock = std::scoped_lock<std::mutex>;
    using unique_lock = std::unique_lock<std::mutex>;
}

#endif // !EVORE_CRANK_MUTEX_HPP
