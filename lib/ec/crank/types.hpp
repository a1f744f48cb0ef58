/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_TYPES_HPP
#define EVORE_CRANK_CRANK_TYPES_HPP

#include <ec/ledger/address.hpp>
#include <ec/ledger/records.hpp>

namespace evore_crank::crank {
    struct deployer {
        ledger::pubkey address {};
        ledger::deployer_record record {};
        ledger::deployer_addresses addrs {};
        uint64_t cached_balance = 0;

        const ledger::pubkey &manager() const
        {
            return record.manager;
        }
    };
    using deployer_list = vector<deployer>;

    // The accounts of a deployer as read at the start of a cycle.
    struct deployer_state {
        uint64_t autodeploy_balance = 0;
        uint64_t auth_balance = 0;
        bool miner_exists = false;
        std::optional<ledger::miner_record> miner {};
        // set when one of the deployer's records could not be decoded
        std::optional<std::string> decode_failure {};
    };

    struct deployer_view {
        const deployer &dep;
        deployer_state state {};
    };
    using deployer_view_list = vector<deployer_view>;

    struct deploy_intent {
        deployer dep {};
        uint64_t amount_per_square = 0;
        uint32_t squares_mask = 0;
        std::optional<uint64_t> checkpoint_round {};
    };
    using intent_list = vector<deploy_intent>;

    enum class skip_reason {
        already_completed, insufficient_balance, decode_error, checkpoint_pending
    };

    struct skipped_deployer {
        ledger::pubkey deployer {};
        skip_reason reason = skip_reason::insufficient_balance;
    };
    using skip_list = vector<skipped_deployer>;
}

namespace fmt {
    template<>
    struct formatter<evore_crank::crank::skip_reason>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using evore_crank::crank::skip_reason;
            switch (v) {
                case skip_reason::already_completed: return fmt::format_to(ctx.out(), "already_completed");
                case skip_reason::insufficient_balance: return fmt::format_to(ctx.out(), "insufficient_balance");
                case skip_reason::decode_error: return fmt::format_to(ctx.out(), "decode_error");
                case skip_reason::checkpoint_pending: return fmt::format_to(ctx.out(), "checkpoint_pending");
                default: throw evore_crank::error(fmt::format("unsupported skip_reason value: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<evore_crank::crank::skipped_deployer>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}:{}", v.deployer, v.reason);
        }
    };
}

#endif // !EVORE_CRANK_CRANK_TYPES_HPP
