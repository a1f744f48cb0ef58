/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_BASE64_HPP
#define EVORE_CRANK_BASE64_HPP

#include <array>
#include <string>
#include <ec/common/bytes.hpp>

namespace evore_crank::base64 {
    inline uint8_vector decode(const std::string_view &in)
    {
        static const std::array<signed char, 128> codes {
            /* 0x00 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x10 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x20 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  62,  -1,  -1,  -1,  63,
            /* 0x30 */ 52,  53,  54,  55,  56,  57,  58,  59,  60,  61,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x40 */ -1,   0,   1,   2,   3,   4,   5,   6,   7,   8,   9,  10,  11,  12,  13,  14,
            /* 0x50 */ 15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25,  -1,  -1,  -1,  -1,  -1,
            /* 0x60 */ -1,  26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,
            /* 0x70 */ 41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51,  -1,  -1,  -1,  -1,  -1
        };
        uint8_vector out {};
        out.reserve(in.size() * 3 / 4);
        int val = 0, valb = -8;
        for (size_t pos = 0; pos < in.size(); ++pos) {
            const auto c = static_cast<signed char>(in[pos]);
            if (c == '=')
                break;
            if (c < 0 || codes[c] == -1)
                throw error(fmt::format("unsupported base64 character: '0x{:x}' at pos {}", static_cast<int>(c), pos));
            val = ((val << 6) + codes[c]) & 0xFFFFFF;
            valb += 6;
            if (valb >= 0) {
                out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        return out;
    }

    inline std::string encode(const buffer &in)
    {
        static constexpr std::string_view alphabet { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
        std::string out {};
        out.reserve((in.size() + 2) / 3 * 4);
        size_t i = 0;
        for (; i + 3 <= in.size(); i += 3) {
            const uint32_t v = (static_cast<uint32_t>(in[i]) << 16) | (static_cast<uint32_t>(in[i + 1]) << 8) | in[i + 2];
            out += alphabet[(v >> 18) & 0x3F];
            out += alphabet[(v >> 12) & 0x3F];
            out += alphabet[(v >> 6) & 0x3F];
            out += alphabet[v & 0x3F];
        }
        if (const auto rem = in.size() - i; rem > 0) {
            uint32_t v = static_cast<uint32_t>(in[i]) << 16;
            if (rem == 2)
                v |= static_cast<uint32_t>(in[i + 1]) << 8;
            out += alphabet[(v >> 18) & 0x3F];
            out += alphabet[(v >> 12) & 0x3F];
            out += rem == 2 ? alphabet[(v >> 6) & 0x3F] : '=';
            out += '=';
        }
        return out;
    }
}

#endif // !EVORE_CRANK_BASE64_HPP
