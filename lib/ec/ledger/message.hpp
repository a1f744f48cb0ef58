/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_MESSAGE_HPP
#define EVORE_CRANK_LEDGER_MESSAGE_HPP

#include <ec/ledger/types.hpp>

namespace evore_crank::ledger {
    // compact-u16: seven bits per byte, at most three bytes
    namespace shortvec {
        static constexpr size_t max_value = 0xFFFF;

        extern void encode(uint8_vector &out, size_t val);
        extern size_t decode(buffer data, size_t &offset);
    }

    struct address_table {
        pubkey address {};
        pubkey_list addresses {};
    };
    using address_table_list = vector<address_table>;

    struct message_header {
        uint8_t num_required_signatures = 0;
        uint8_t num_readonly_signed = 0;
        uint8_t num_readonly_unsigned = 0;

        bool operator==(const message_header &o) const =default;
    };

    struct compiled_instruction {
        uint8_t program_idx = 0;
        vector<uint8_t> accounts {};
        uint8_vector data {};
    };

    struct table_lookup {
        pubkey table {};
        vector<uint8_t> writable {};
        vector<uint8_t> readonly {};
    };

    struct message_v0 {
        static constexpr uint8_t version_prefix = 0x80;

        message_header header {};
        pubkey_list static_keys {};
        blockhash recent_blockhash {};
        vector<compiled_instruction> instructions {};
        vector<table_lookup> lookups {};

        // Signers and invoked programs always stay in the static keys; other accounts found in a table are referenced through it.
        static message_v0 compile(const pubkey &payer, const instruction_list &ixs, const blockhash &recent_blockhash,
            const address_table_list &tables={});
        static message_v0 deserialize(buffer data);

        uint8_vector serialize() const;
        size_t num_lookup_accounts() const;

        size_t num_accounts() const
        {
            return static_keys.size() + num_lookup_accounts();
        }
    };

    struct transaction {
        vector<signature> signatures {};
        message_v0 message {};

        // Supports messages whose only required signer is the fee payer.
        static transaction sign(message_v0 &&msg, const keypair &kp);

        uint8_vector serialize() const;
    };
}

#endif // !EVORE_CRANK_LEDGER_MESSAGE_HPP
