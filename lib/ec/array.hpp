/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_ARRAY_HPP
#define EVORE_CRANK_ARRAY_HPP

#include <array>
#include <cstring>
#include <span>
#include <ec/common/error.hpp>
#include <ec/common/format.hpp>
#include <ec/common/bytes.hpp>

namespace evore_crank {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;
        using base_type::base_type;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const std::initializer_list<uint8_t> s) {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            size_t i = 0;
            for (const auto b: s)
                *(base_type::data() + i++) = b;
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(base_type::data()), base_type::size() };
        }
    };

    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array &) =default;
        secure_byte_array &operator=(const secure_byte_array &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<evore_crank::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };
}

#endif // !EVORE_CRANK_ARRAY_HPP
