/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_COMMON_ERROR_HPP
#define EVORE_CRANK_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace evore_crank {
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
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };

    // The ledger could not be reached or answered with an error; the current cycle is skipped.
    struct ledger_unavailable: error {
        using error::error;
    };

    // A transaction was refused locally or by the ledger; affects only its own batch.
    struct submit_rejected: error {
        using error::error;
    };

    // An on-ledger record does not match its fixed layout.
    struct decode_error: error {
        using error::error;
    };

    // Invalid settings detected at startup; fatal.
    struct configuration_error: error {
        using error::error;
    };

    // A short stable name of the error category used in cycle summaries.
    extern std::string_view error_kind(const std::exception &ex) noexcept;
}

#endif // !EVORE_CRANK_COMMON_ERROR_HPP
