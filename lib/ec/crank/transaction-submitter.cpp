/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <ec/crank/transaction-submitter.hpp>
#include <ec/logger.hpp>

namespace evore_crank::crank {
    transaction_submitter::transaction_submitter(ledger::reader &reader, const ledger::keypair &payer):
        _reader { reader }, _payer { payer }
    {
    }

    ledger::transaction transaction_submitter::build(const ledger::instruction_list &ixs, const ledger::blockhash &recent_blockhash,
        const std::optional<ledger::address_table> &table) const
    {
        ledger::address_table_list tables {};
        if (table)
            tables.emplace_back(*table);
        auto msg = ledger::message_v0::compile(_payer.public_key, ixs, recent_blockhash, tables);
        if (const auto num_accounts = msg.num_accounts(); num_accounts > ledger::max_tx_accounts)
            throw submit_rejected(fmt::format("a transaction references {} accounts while at most {} are allowed", num_accounts, ledger::max_tx_accounts));
        auto tx = ledger::transaction::sign(std::move(msg), _payer);
        if (const auto tx_size = tx.serialize().size(); tx_size > ledger::max_tx_size)
            throw submit_rejected(fmt::format("a transaction of {} bytes exceeds the limit of {} bytes", tx_size, ledger::max_tx_size));
        return tx;
    }

    submit_result transaction_submitter::submit(const ledger::instruction_list &ixs, const std::optional<ledger::address_table> &table)
    {
        submit_result res {};
        try {
            const auto bh = _reader.latest_blockhash();
            const auto tx = build(ixs, bh.hash, table);
            const auto tx_bytes = tx.serialize();
            res.tx_size = tx_bytes.size();
            res.num_accounts = tx.message.num_accounts();
            const auto sig = _reader.submit_transaction(tx_bytes);
            if (sig != tx.signatures.at(0))
                logger::warn("the ledger acknowledged signature {} for a transaction signed as {}", sig, tx.signatures.at(0));
            res.sig = sig;
            logger::debug("submitted {}: {} instructions {} bytes {} accounts", sig, ixs.size(), res.tx_size, res.num_accounts);
        } catch (const std::exception &ex) {
            res.error = fmt::format("{}: {}", error_kind(ex), ex.what());
            logger::warn("transaction submission failed: {}", *res.error);
        }
        return res;
    }
}
