/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_ZPP_HPP
#define CANON_CBOR_ZPP_HPP

#include <zpp_bits.h>
#include <canon/common/bytes.hpp>

// The native zpp_bits encoding of types that share their serialize member with the canonical codec.
namespace canon_cbor::zpp {
    template<typename T>
    void deserialize(T &v, const buffer zpp_data)
    {
        ::zpp::bits::in in { zpp_data };
        in(v).or_throw();
    }

    template<typename T>
    T deserialize(const buffer zpp_data)
    {
        T v {};
        deserialize(v, zpp_data);
        return v;
    }

    template<typename T>
    uint8_vector serialize(const T &v)
    {
        uint8_vector zpp_data {};
        ::zpp::bits::out out { zpp_data };
        out(v).or_throw();
        return zpp_data;
    }
}

#endif // !CANON_CBOR_ZPP_HPP
