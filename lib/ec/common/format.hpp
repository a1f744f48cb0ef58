/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef EVORE_CRANK_COMMON_FORMAT_HPP
#define EVORE_CRANK_COMMON_FORMAT_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"

namespace evore_crank {
    using fmt::format;
}

namespace fmt {
    template <typename T>
    concept derived_from_base = requires(T v)
    {
        { static_cast<typename T::base_type>(v) };
    };

    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (uint8_t v: data) {
                out_it = fmt::format_to(out_it, "{:02X}", v);
            }
            return out_it;
        }
    };

    template<typename X, typename Y>
    struct formatter<std::pair<X, Y>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", v.first, v.second);
        }
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}{}", *it, sep);
            }
            return fmt::format_to(out_it, "]");
        }
    };

    template<typename T, typename A>
    struct formatter<std::set<T, std::less<T>, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "[");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}{}", *it, sep);
            }
            return fmt::format_to(out_it, "]");
        }
    };

    template<typename K, typename V, typename A>
    struct formatter<std::map<K, V, std::less<K>, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (auto it = v.begin(); it != v.end(); ++it) {
                const std::string sep { std::next(it) == v.end() ? "" : ", " };
                out_it = fmt::format_to(out_it, "{}={}{}", it->first, it->second, sep);
            }
            return fmt::format_to(out_it, "}}");
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };

    template<>
    struct formatter<std::chrono::milliseconds>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}ms", v.count());
        }
    };

    template<>
    struct formatter<std::source_location>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::source_location &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}:{} `{}`", v.file_name(), v.line(), v.function_name());
        }
    };

    template<derived_from_base T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const typename T::base_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v);
        }
    };
}

#endif // !EVORE_CRANK_COMMON_FORMAT_HPP
