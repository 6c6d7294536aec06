#pragma once
#ifndef CANON_CBOR_ARRAY_HPP
#define CANON_CBOR_ARRAY_HPP
/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <cstring>
#include <span>
#include <canon/common/error.hpp>
#include <canon/common/format.hpp>
#include <canon/common/bytes.hpp>

namespace canon_cbor {
    // Fixed-size byte strings such as hashes and keys; maps to a CBOR byte string of exactly SZ bytes.
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

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
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<canon_cbor::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };
}

#endif //CANON_CBOR_ARRAY_HPP
