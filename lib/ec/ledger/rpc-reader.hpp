/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_RPC_READER_HPP
#define EVORE_CRANK_LEDGER_RPC_READER_HPP

#include <chrono>
#include <memory>
#include <ec/json.hpp>
#include <ec/ledger/reader.hpp>

namespace evore_crank::ledger {
    // JSON-RPC over a single HTTP/1.1 keep-alive connection with per-operation timeouts.
    struct rpc_reader: reader {
        static constexpr std::string_view commitment { "confirmed" };

        explicit rpc_reader(const std::string &url, std::chrono::milliseconds timeout=std::chrono::seconds { 10 });
        ~rpc_reader() override;

        // Sends a raw JSON-RPC request and returns its result member.
        json::value call(std::string_view method, json::array params);
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        uint64_t _get_slot_impl() override;
        optional_account _get_account_impl(const pubkey &addr) override;
        vector<optional_account> _get_accounts_impl(const pubkey_list &addrs) override;
        vector<keyed_account> _get_program_accounts_impl(const pubkey &program, const filter_list &filters) override;
        blockhash_info _latest_blockhash_impl() override;
        signature _submit_transaction_impl(const buffer &tx_bytes) override;
        confirmation_status _confirm_transaction_impl(const signature &sig) override;
    };

    // Converts an account object of a JSON-RPC response with base64-encoded data.
    extern optional_account parse_account(const json::value &j);
    extern confirmation_status parse_signature_status(const json::value &j);
}

#endif // !EVORE_CRANK_LEDGER_RPC_READER_HPP
