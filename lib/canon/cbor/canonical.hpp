/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_CANONICAL_HPP
#define CANON_CBOR_CBOR_CANONICAL_HPP

#include <compare>
#include <canon/common/bytes.hpp>
#include <canon/cbor/encoder.hpp>
#include <canon/cbor/value.hpp>

namespace canon_cbor::cbor {
    // The canonical order of map keys: shorter encodings first, equal lengths compared bytewise.
    inline std::strong_ordering compare_keys(const buffer a, const buffer b) noexcept
    {
        if (a.size() != b.size())
            return a.size() <=> b.size();
        return a <=> b;
    }

    // Appends the canonical encoding of v.
    // Throws invariant_error on values the decoder would reject, such as duplicate map keys or invalid UTF-8.
    // Nesting is limited to default_max_depth.
    extern void encode(encoder &enc, const value &v);
    extern uint8_vector encode(const value &v);
}

#endif // !CANON_CBOR_CBOR_CANONICAL_HPP
