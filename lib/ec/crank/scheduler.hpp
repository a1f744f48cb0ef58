/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_SCHEDULER_HPP
#define EVORE_CRANK_CRANK_SCHEDULER_HPP

#include <atomic>
#include <ec/crank/admission-controller.hpp>
#include <ec/crank/batch-builder.hpp>
#include <ec/crank/completion-tracker.hpp>
#include <ec/crank/lookup-table-manager.hpp>
#include <ec/crank/round-monitor.hpp>
#include <ec/crank/settings.hpp>
#include <ec/crank/transaction-submitter.hpp>

namespace evore_crank::crank {
    using clock_func = std::function<std::chrono::steady_clock::time_point()>;

    // Everything a cycle reads or mutates; owned by the caller and used from one thread.
    struct context {
        context(ledger::reader &reader, const settings &cfg, const ledger::keypair &authority, deployer_list deployers,
            sleep_func sleep, std::unique_ptr<completion_tracker> tracker=std::make_unique<completion_tracker_memory>());
        context(const context &) =delete;
        context &operator=(const context &) =delete;

        ledger::reader &reader;
        const settings cfg;
        const ledger::keypair authority;
        deployer_list deployers;
        sleep_func sleep;
        miner_probe_cache probes {};
        std::unique_ptr<completion_tracker> tracker;
        balance_calculator calc;
        transaction_submitter submitter;
        lookup_table_manager luts;
        round_monitor monitor;
    };

    struct pending_confirmation {
        ledger::signature sig {};
        uint64_t round_id = 0;
        uint64_t submit_slot = 0;
        size_t submit_cycle = 0;
        ledger::pubkey_list deployers {};
        ledger::pubkey_list checkpointed {};
    };

    struct cycle_summary {
        size_t cycle = 0;
        std::optional<round_status> round {};
        // set when the round state allowed no attempt this cycle
        std::optional<std::string> idle_reason {};
        // set when the ledger could not be read
        std::optional<std::string> error {};
        size_t admitted = 0;
        size_t checkpoint_only = 0;
        size_t batches_submitted = 0;
        size_t batches_failed = 0;
        skip_list skips {};
    };

    struct scheduler {
        static constexpr uint64_t confirmation_expiry_slots = 150;
        static constexpr size_t confirmation_expiry_cycles = 60;

        explicit scheduler(context &ctx, clock_func clock=std::chrono::steady_clock::now);

        // Never throws ledger_unavailable: such a cycle is reported through the summary and skipped.
        cycle_summary run_cycle();
        // Runs cycles on the poll interval until max_cycles are done or stop is set; returns the number of cycles run.
        size_t run(std::optional<size_t> max_cycles, const std::atomic_bool &stop);

        const vector<pending_confirmation> &pending() const
        {
            return _pending;
        }
    private:
        context &_ctx;
        clock_func _clock;
        size_t _cycle = 0;
        vector<pending_confirmation> _pending {};

        void _check_confirmations(uint64_t current_slot);
        std::optional<std::string> _idle_reason(const round_status &st) const;
        deployer_view_list _snapshot();
        void _submit(const admission &adm, const round_status &st, cycle_summary &sum);
        bool _checkpoint_pending(const ledger::pubkey &deployer) const;
    };
}

namespace fmt {
    template<>
    struct formatter<evore_crank::crank::cycle_summary>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            auto out_it = fmt::format_to(ctx.out(), "cycle {}", v.cycle);
            if (v.round)
                out_it = fmt::format_to(out_it, " round {} {} slots left: {}", v.round->round_id, v.round->phase, v.round->slots_remaining);
            if (v.error)
                return fmt::format_to(out_it, " skipped: {}", *v.error);
            if (v.idle_reason)
                return fmt::format_to(out_it, " idle: {}", *v.idle_reason);
            return fmt::format_to(out_it, " admitted: {} checkpoint-only: {} submitted: {} failed: {} skipped: {} {}",
                v.admitted, v.checkpoint_only, v.batches_submitted, v.batches_failed, v.skips.size(), v.skips);
        }
    };
}

#endif // !EVORE_CRANK_CRANK_SCHEDULER_HPP
