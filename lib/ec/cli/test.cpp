/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/cli/common.hpp>
#include <ec/ledger/instructions.hpp>

namespace evore_crank::cli::test {
    struct cmd: command {
        static constexpr size_t confirm_attempts = 60;
        static constexpr std::chrono::milliseconds confirm_interval { 500 };

        void configure(config &cmd) const override
        {
            cmd.name = "test";
            cmd.desc = "submit a zero-lamport transfer to self to check the keypair, the RPC endpoint and the fee settings";
            common::add_opts(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            common::session s { opts };
            const auto &payer = s.authority.public_key;
            if (const auto acc = s.reader.get_account(payer); acc)
                logger::info("the deploy authority holds {} lamports", acc->lamports);
            else
                logger::warn("the deploy authority account {} does not exist", payer);
            const ledger::instruction_list ixs {
                ledger::compute_budget::set_unit_limit(5'000),
                ledger::compute_budget::set_unit_price(s.cfg.priority_fee),
                ledger::system_program::transfer(payer, payer, 0)
            };
            const auto res = s.submitter.submit(ixs);
            if (!res)
                throw error(fmt::format("the test transaction was not accepted: {}", *res.error));
            logger::info("submitted {} in {} bytes", *res.sig, res.tx_size);
            for (size_t i = 0; i < confirm_attempts; ++i) {
                const auto status = s.reader.confirm_transaction(*res.sig);
                if (status == ledger::confirmation_status::confirmed) {
                    logger::info("{} confirmed", *res.sig);
                    return;
                }
                if (status == ledger::confirmation_status::failed)
                    throw error(fmt::format("{} failed on the ledger", *res.sig));
                common::thread_sleep(confirm_interval);
            }
            throw error(fmt::format("{} has not been confirmed in time", *res.sig));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
