/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_LEDGER_TYPES_HPP
#define EVORE_CRANK_LEDGER_TYPES_HPP

#include <optional>
#include <string>
#include <ec/array.hpp>
#include <ec/base58.hpp>
#include <ec/container.hpp>
#include <ec/ed25519.hpp>

namespace evore_crank::ledger {
    static constexpr uint64_t lamports_per_sol = 1'000'000'000ULL;
    static constexpr size_t max_tx_size = 1232;
    static constexpr size_t max_tx_accounts = 64;

    struct pubkey: byte_array<32> {
        using base_type = byte_array<32>;
        using base_type::base_type;

        static pubkey from_base58(const std::string_view text)
        {
            const auto bytes = base58::decode(text);
            if (bytes.size() != 32)
                throw error(fmt::format("a base58 address must decode to 32 bytes but {} gives {}", text, bytes.size()));
            return pubkey { static_cast<buffer>(bytes) };
        }

        pubkey() =default;

        pubkey(const byte_array<32> &o): base_type { o }
        {
        }

        std::string to_base58() const
        {
            return base58::encode(*this);
        }
    };
    using pubkey_list = vector<pubkey>;

    struct signature: ed25519::signature {
        using base_type = ed25519::signature;
        using base_type::base_type;

        static signature from_base58(const std::string_view text)
        {
            const auto bytes = base58::decode(text);
            if (bytes.size() != 64)
                throw error(fmt::format("a base58 signature must decode to 64 bytes but {} gives {}", text, bytes.size()));
            return signature { static_cast<buffer>(bytes) };
        }

        signature() =default;

        signature(const ed25519::signature &o): base_type { o }
        {
        }

        std::string to_base58() const
        {
            return base58::encode(*this);
        }
    };

    using blockhash = pubkey;

    struct account_meta {
        pubkey key {};
        bool is_signer = false;
        bool is_writable = false;
    };

    struct instruction {
        pubkey program_id {};
        vector<account_meta> accounts {};
        uint8_vector data {};
    };
    using instruction_list = vector<instruction>;

    struct account_info {
        uint64_t lamports = 0;
        pubkey owner {};
        uint8_vector data {};
    };
    using optional_account = std::optional<account_info>;

    struct keyed_account {
        pubkey address {};
        account_info account {};
    };

    // A 64-byte keypair in the customary layout: 32-byte seed followed by the public key.
    struct keypair {
        ed25519::skey secret {};
        pubkey public_key {};
    };
}

namespace fmt {
    template<>
    struct formatter<evore_crank::ledger::pubkey>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_base58());
        }
    };

    template<>
    struct formatter<evore_crank::ledger::signature>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_base58());
        }
    };
}

#endif // !EVORE_CRANK_LEDGER_TYPES_HPP
