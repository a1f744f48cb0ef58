/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_ROUND_MONITOR_HPP
#define EVORE_CRANK_CRANK_ROUND_MONITOR_HPP

#include <ec/ledger/reader.hpp>
#include <ec/ledger/records.hpp>

namespace evore_crank::crank {
    enum class round_phase {
        waiting, active, intermission, awaiting_reset
    };

    struct round_status {
        uint64_t round_id = 0;
        round_phase phase = round_phase::waiting;
        uint64_t slots_remaining = 0;
        uint64_t current_slot = 0;
        uint64_t start_slot = 0;
        uint64_t end_slot = 0;
        bool round_changed = false;
    };

    extern round_phase classify_phase(uint64_t end_slot, uint64_t current_slot, uint64_t intermission_window);

    struct round_monitor {
        static constexpr uint64_t default_intermission_window = 35;

        explicit round_monitor(ledger::reader &reader, uint64_t intermission_window=default_intermission_window);

        // Throws ledger_unavailable when the board or the slot cannot be read.
        round_status poll();

        std::optional<uint64_t> last_round_id() const
        {
            return _last_round_id;
        }
    private:
        ledger::reader &_reader;
        const uint64_t _intermission_window;
        std::optional<uint64_t> _last_round_id {};
    };
}

namespace fmt {
    template<>
    struct formatter<evore_crank::crank::round_phase>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using evore_crank::crank::round_phase;
            switch (v) {
                case round_phase::waiting: return fmt::format_to(ctx.out(), "waiting");
                case round_phase::active: return fmt::format_to(ctx.out(), "active");
                case round_phase::intermission: return fmt::format_to(ctx.out(), "intermission");
                case round_phase::awaiting_reset: return fmt::format_to(ctx.out(), "awaiting-reset");
                default: throw evore_crank::error(fmt::format("unsupported round_phase value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !EVORE_CRANK_CRANK_ROUND_MONITOR_HPP
