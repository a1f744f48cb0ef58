/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <ec/base58.hpp>

namespace evore_crank::base58 {
    static constexpr std::string_view alphabet { "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };

    static int8_t decode_char(const char k)
    {
        static const auto codes = [] {
            std::array<int8_t, 128> res {};
            res.fill(-1);
            for (size_t i = 0; i < alphabet.size(); ++i)
                res[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
            return res;
        }();
        const auto uk = static_cast<uint8_t>(k);
        if (uk >= codes.size() || codes[uk] < 0)
            throw error(fmt::format("unsupported base58 character: '{}'", k));
        return codes[uk];
    }

    std::string encode(const buffer &data)
    {
        size_t zeros = 0;
        while (zeros < data.size() && data[zeros] == 0)
            ++zeros;
        // log(256) / log(58) < 1.38
        std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
        size_t used = 0;
        for (size_t i = zeros; i < data.size(); ++i) {
            uint32_t carry = data[i];
            size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
                carry += 256U * *it;
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            used = j;
        }
        auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - used);
        while (it != digits.end() && *it == 0)
            ++it;
        std::string res(zeros, '1');
        for (; it != digits.end(); ++it)
            res += alphabet[*it];
        return res;
    }

    uint8_vector decode(const std::string_view text)
    {
        size_t zeros = 0;
        while (zeros < text.size() && text[zeros] == '1')
            ++zeros;
        // log(58) / log(256) < 0.733
        std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
        size_t used = 0;
        for (size_t i = zeros; i < text.size(); ++i) {
            uint32_t carry = static_cast<uint32_t>(decode_char(text[i]));
            size_t j = 0;
            for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
                carry += 58U * *it;
                *it = static_cast<uint8_t>(carry & 0xFF);
                carry >>= 8;
            }
            if (carry != 0)
                throw error(fmt::format("base58 overflow while decoding {}", text));
            used = j;
        }
        auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - used);
        while (it != bytes.end() && *it == 0)
            ++it;
        uint8_vector res(zeros);
        res.insert(res.end(), it, bytes.end());
        return res;
    }
}
