/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_READER_HPP
#define EVORE_CRANK_LEDGER_READER_HPP

#include <ec/ledger/types.hpp>

namespace evore_crank::ledger {
    struct memcmp_filter {
        size_t offset = 0;
        uint8_vector bytes {};
    };
    using filter_list = vector<memcmp_filter>;

    struct blockhash_info {
        blockhash hash {};
        uint64_t last_valid_block_height = 0;
    };

    enum class confirmation_status {
        pending, confirmed, failed
    };

    // All methods throw ledger_unavailable when the ledger cannot answer.
    struct reader {
        static constexpr size_t max_accounts_per_request = 100;

        virtual ~reader() =default;

        uint64_t get_slot()
        {
            return _get_slot_impl();
        }

        optional_account get_account(const pubkey &addr)
        {
            return _get_account_impl(addr);
        }

        // Returns one entry per requested address and in the same order; reads are chunked.
        vector<optional_account> get_accounts(const pubkey_list &addrs)
        {
            vector<optional_account> res {};
            res.reserve(addrs.size());
            for (size_t start = 0; start < addrs.size(); start += max_accounts_per_request) {
                const auto end = std::min(addrs.size(), start + max_accounts_per_request);
                const pubkey_list chunk { addrs.begin() + static_cast<std::ptrdiff_t>(start), addrs.begin() + static_cast<std::ptrdiff_t>(end) };
                auto chunk_res = _get_accounts_impl(chunk);
                if (chunk_res.size() != chunk.size())
                    throw ledger_unavailable(fmt::format("requested {} accounts but received {}", chunk.size(), chunk_res.size()));
                for (auto &acc: chunk_res)
                    res.emplace_back(std::move(acc));
            }
            return res;
        }

        vector<keyed_account> get_program_accounts(const pubkey &program, const filter_list &filters)
        {
            return _get_program_accounts_impl(program, filters);
        }

        blockhash_info latest_blockhash()
        {
            return _latest_blockhash_impl();
        }

        signature submit_transaction(const buffer &tx_bytes)
        {
            return _submit_transaction_impl(tx_bytes);
        }

        confirmation_status confirm_transaction(const signature &sig)
        {
            return _confirm_transaction_impl(sig);
        }
    private:
        virtual uint64_t _get_slot_impl() =0;
        virtual optional_account _get_account_impl(const pubkey &addr) =0;
        virtual vector<optional_account> _get_accounts_impl(const pubkey_list &addrs) =0;
        virtual vector<keyed_account> _get_program_accounts_impl(const pubkey &program, const filter_list &filters) =0;
        virtual blockhash_info _latest_blockhash_impl() =0;
        virtual signature _submit_transaction_impl(const buffer &tx_bytes) =0;
        virtual confirmation_status _confirm_transaction_impl(const signature &sig) =0;
    };
}

namespace fmt {
    template<>
    struct formatter<evore_crank::ledger::confirmation_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using evore_crank::ledger::confirmation_status;
            switch (v) {
                case confirmation_status::pending: return fmt::format_to(ctx.out(), "pending");
                case confirmation_status::confirmed: return fmt::format_to(ctx.out(), "confirmed");
                case confirmation_status::failed: return fmt::format_to(ctx.out(), "failed");
                default: throw evore_crank::error(fmt::format("unsupported confirmation_status value: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !EVORE_CRANK_LEDGER_READER_HPP
