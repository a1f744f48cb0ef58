/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_CRANK_TRANSACTION_SUBMITTER_HPP
#define EVORE_CRANK_CRANK_TRANSACTION_SUBMITTER_HPP

#include <ec/ledger/message.hpp>
#include <ec/ledger/reader.hpp>

namespace evore_crank::crank {
    struct submit_result {
        std::optional<ledger::signature> sig {};
        std::optional<std::string> error {};
        size_t tx_size = 0;
        size_t num_accounts = 0;

        explicit operator bool() const
        {
            return !static_cast<bool>(error);
        }
    };

    struct transaction_submitter {
        transaction_submitter(ledger::reader &reader, const ledger::keypair &payer);

        // Compiles a version 0 message; with a table only the addresses it already holds are referenced through it.
        // Throws submit_rejected when the transaction exceeds the ledger's size or account limits.
        ledger::transaction build(const ledger::instruction_list &ixs, const ledger::blockhash &recent_blockhash,
            const std::optional<ledger::address_table> &table={}) const;

        // Never throws: every failure is reported through the result.
        submit_result submit(const ledger::instruction_list &ixs, const std::optional<ledger::address_table> &table={});

        const ledger::pubkey &payer() const
        {
            return _payer.public_key;
        }
    private:
        ledger::reader &_reader;
        const ledger::keypair &_payer;
    };
}

#endif // !EVORE_CRANK_CRANK_TRANSACTION_SUBMITTER_HPP
