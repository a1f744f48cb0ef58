/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

extern "C" {
#   include <sodium.h>
}
#include <ec/ed25519.hpp>
#include <ec/sha2.hpp>

namespace evore_crank::sha2 {
    hash_256 digest(const buffer &in)
    {
        return digest({ in });
    }

    hash_256 digest(const std::initializer_list<buffer> parts)
    {
        static_assert(sizeof(hash_256) == crypto_hash_sha256_BYTES);
        ed25519::ensure_initialized();
        crypto_hash_sha256_state state;
        if (crypto_hash_sha256_init(&state) != 0)
            throw error("sha2 initialization failed!");
        for (const auto &p: parts) {
            if (crypto_hash_sha256_update(&state, p.data(), p.size()) != 0)
                throw error("sha2 update failed!");
        }
        hash_256 out {};
        if (crypto_hash_sha256_final(&state, out.data()) != 0)
            throw error("sha2 finalization failed!");
        return out;
    }
}
