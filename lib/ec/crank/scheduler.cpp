/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/scheduler.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    context::context(ledger::reader &reader_, const settings &cfg_, const ledger::keypair &authority_, deployer_list deployers_,
            sleep_func sleep_, std::unique_ptr<completion_tracker> tracker_):
        reader { reader_ }, cfg { cfg_ }, authority { authority_ }, deployers { std::move(deployers_) },
        sleep { std::move(sleep_) }, tracker { std::move(tracker_) }, calc { cfg.fees }, submitter { reader, authority },
        luts { reader, submitter, sleep }, monitor { reader, cfg.intermission_window }
    {
        if (!tracker)
            throw error("a completion tracker is required");
    }

    scheduler::scheduler(context &ctx, clock_func clock):
        _ctx { ctx }, _clock { std::move(clock) }
    {
    }

    bool scheduler::_checkpoint_pending(const ledger::pubkey &deployer) const
    {
        for (const auto &p: _pending) {
            if (std::find(p.checkpointed.begin(), p.checkpointed.end(), deployer) != p.checkpointed.end())
                return true;
        }
        return false;
    }

    void scheduler::_check_confirmations(const uint64_t current_slot)
    {
        std::erase_if(_pending, [&](const auto &p) {
            ledger::confirmation_status status = ledger::confirmation_status::pending;
            try {
                status = _ctx.reader.confirm_transaction(p.sig);
            } catch (const ledger_unavailable &ex) {
                logger::debug("the status of {} is unavailable: {}", p.sig, ex.what());
            }
            switch (status) {
                case ledger::confirmation_status::confirmed:
                    logger::info("round {}: {} confirmed deploys: {} checkpoints: {}", p.round_id, p.sig, p.deployers.size(), p.checkpointed.size());
                    return true;
                case ledger::confirmation_status::failed:
                    logger::warn("round {}: {} failed on the ledger; deployers: {}", p.round_id, p.sig, p.deployers);
                    return true;
                default:
                    break;
            }
            if (current_slot > p.submit_slot + confirmation_expiry_slots || _cycle > p.submit_cycle + confirmation_expiry_cycles) {
                logger::warn("round {}: {} has not been confirmed in time and is no longer tracked", p.round_id, p.sig);
                return true;
            }
            return false;
        });
    }

    std::optional<std::string> scheduler::_idle_reason(const round_status &st) const
    {
        if (st.phase != round_phase::active)
            return fmt::format("the round is {}", st.phase);
        if (st.slots_remaining > _ctx.cfg.deploy_threshold_slots)
            return fmt::format("more than {} slots left", _ctx.cfg.deploy_threshold_slots);
        if (st.slots_remaining < _ctx.cfg.min_slots)
            return fmt::format("fewer than {} slots left", _ctx.cfg.min_slots);
        return {};
    }

    deployer_view_list scheduler::_snapshot()
    {
        static constexpr size_t accounts_per_deployer = 3;
        ledger::pubkey_list addrs {};
        addrs.reserve(_ctx.deployers.size() * accounts_per_deployer);
        for (const auto &dep: _ctx.deployers) {
            addrs.emplace_back(dep.addrs.autodeploy_balance.address);
            addrs.emplace_back(dep.addrs.managed_miner_auth.address);
            addrs.emplace_back(dep.addrs.ore_miner.address);
        }
        const auto accounts = _ctx.reader.get_accounts(addrs);
        deployer_view_list views {};
        views.reserve(_ctx.deployers.size());
        for (size_t i = 0; i < _ctx.deployers.size(); ++i) {
            auto &dep = _ctx.deployers[i];
            const auto &balance_acc = accounts.at(i * accounts_per_deployer);
            const auto &auth_acc = accounts.at(i * accounts_per_deployer + 1);
            const auto &miner_acc = accounts.at(i * accounts_per_deployer + 2);
            deployer_state st {};
            st.autodeploy_balance = balance_acc ? balance_acc->lamports : 0;
            st.auth_balance = auth_acc ? auth_acc->lamports : 0;
            st.miner_exists = _ctx.probes.exists(dep.addrs.ore_miner.address, miner_acc.has_value());
            if (miner_acc) {
                try {
                    st.miner = ledger::miner_record::decode(miner_acc->data);
                } catch (const decode_error &ex) {
                    st.decode_failure = fmt::format("miner {}: {}", dep.addrs.ore_miner.address, ex.what());
                }
            }
            dep.cached_balance = st.autodeploy_balance;
            views.emplace_back(deployer_view { dep, std::move(st) });
        }
        return views;
    }

    void scheduler::_submit(const admission &adm, const round_status &st, cycle_summary &sum)
    {
        admission todo { adm.to_deploy, {}, {} };
        for (const auto &intent: adm.to_checkpoint_only) {
            if (_checkpoint_pending(intent.dep.address)) {
                logger::debug("deployer {}: a checkpoint is already awaiting confirmation", intent.dep.address);
                --sum.checkpoint_only;
                sum.skips.emplace_back(skipped_deployer { intent.dep.address, skip_reason::checkpoint_pending });
                continue;
            }
            todo.to_checkpoint_only.emplace_back(intent);
        }
        const batch_builder builder { _ctx.submitter.payer(), _ctx.cfg.auth_id, _ctx.cfg.priority_fee };
        const auto batches = builder.build(todo, _ctx.luts, st.round_id);
        const auto table = _ctx.luts.table();
        for (const auto &b: batches) {
            const auto res = _ctx.submitter.submit(b.instructions, table);
            if (!res) {
                ++sum.batches_failed;
                logger::warn("round {}: a batch of {} deploys and {} checkpoints was rejected: {}",
                    st.round_id, b.deployers.size(), b.checkpointed.size(), *res.error);
                continue;
            }
            ++sum.batches_submitted;
            for (const auto &dep: b.deployers)
                _ctx.tracker->mark_submitted(dep, st.round_id);
            _pending.emplace_back(pending_confirmation { *res.sig, st.round_id, st.current_slot, _cycle, b.deployers, b.checkpointed });
            logger::info("round {}: submitted {} with {} deploys and {} checkpoints in {} bytes",
                st.round_id, *res.sig, b.deployers.size(), b.checkpointed.size(), res.tx_size);
        }
    }

    cycle_summary scheduler::run_cycle()
    {
        cycle_summary sum { .cycle=++_cycle };
        try {
            const auto st = _ctx.monitor.poll();
            sum.round = st;
            if (st.round_changed)
                _ctx.tracker->on_round_change(st.round_id);
            _check_confirmations(st.current_slot);
            sum.idle_reason = _idle_reason(st);
            if (!sum.idle_reason) {
                const auto views = _snapshot();
                const admission_controller ac { _ctx.calc, *_ctx.tracker };
                const auto adm = ac.evaluate(views, st.round_id, _ctx.cfg.amount_per_square, _ctx.cfg.squares_mask);
                sum.admitted = adm.to_deploy.size();
                sum.checkpoint_only = adm.to_checkpoint_only.size();
                sum.skips = adm.skips;
                _submit(adm, st, sum);
            }
        } catch (const ledger_unavailable &ex) {
            sum.error = ex.what();
        }
        if (sum.error)
            logger::warn("{}", sum);
        else if (sum.idle_reason)
            logger::debug("{}", sum);
        else
            logger::info("{}", sum);
        return sum;
    }

    size_t scheduler::run(const std::optional<size_t> max_cycles, const std::atomic_bool &stop)
    {
        size_t num_cycles = 0;
        while (!stop.load() && (!max_cycles || num_cycles < *max_cycles)) {
            const auto start = _clock();
            run_cycle();
            ++num_cycles;
            if (stop.load() || (max_cycles && num_cycles >= *max_cycles))
                break;
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(_clock() - start);
            if (elapsed < _ctx.cfg.poll_interval)
                _ctx.sleep(_ctx.cfg.poll_interval - elapsed);
        }
        logger::info("the scheduler stopped after {} cycles", num_cycles);
        return num_cycles;
    }
}
