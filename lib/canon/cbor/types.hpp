/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_TYPES_HPP
#define CANON_CBOR_CBOR_TYPES_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <canon/common/format.hpp>

namespace canon_cbor::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    inline bool is_ascii(const std::span<const uint8_t> b)
    {
        for (const uint8_t *p = b.data(), *end = p + b.size(); p < end; ++p) {
            if (*p < 32 || *p > 127) [[unlikely]]
                return false;
        }
        return true;
    }

    // RFC 3629: rejects overlong forms, surrogates and code points above U+10FFFF
    inline bool is_utf8(const std::span<const uint8_t> b)
    {
        for (const uint8_t *p = b.data(), *end = p + b.size(); p < end; ) {
            const uint8_t c = *p;
            if (c < 0x80) {
                ++p;
                continue;
            }
            size_t len;
            uint32_t cp;
            uint32_t min_cp;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
                min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
                min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
                min_cp = 0x10000;
            } else [[unlikely]] {
                return false;
            }
            if (static_cast<size_t>(end - p) < len) [[unlikely]]
                return false;
            for (size_t i = 1; i < len; ++i) {
                if ((p[i] & 0xC0) != 0x80) [[unlikely]]
                    return false;
                cp = (cp << 6) | (p[i] & 0x3F);
            }
            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) [[unlikely]]
                return false;
            p += len;
        }
        return true;
    }

    inline bool is_utf8(const std::string_view s)
    {
        return is_utf8(std::span<const uint8_t> { reinterpret_cast<const uint8_t *>(s.data()), s.size() });
    }
}

namespace fmt {
    template<>
    struct formatter<canon_cbor::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using canon_cbor::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<canon_cbor::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using canon_cbor::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CANON_CBOR_CBOR_TYPES_HPP
