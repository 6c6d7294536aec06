/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/cbor/encoder.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;
using namespace canon_cbor::cbor;

namespace {
    uint8_vector encode_uint(const uint64_t val)
    {
        encoder enc {};
        enc.uint(val);
        return enc.cbor();
    }

    uint8_vector encode_nint(const uint64_t raw)
    {
        encoder enc {};
        enc.nint(raw);
        return enc.cbor();
    }
}

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "unsigned integers use the shortest form"_test = [] {
            test_same(encode_uint(0), uint8_vector::from_hex("00"));
            test_same(encode_uint(1), uint8_vector::from_hex("01"));
            test_same(encode_uint(10), uint8_vector::from_hex("0A"));
            test_same(encode_uint(23), uint8_vector::from_hex("17"));
            test_same(encode_uint(24), uint8_vector::from_hex("1818"));
            test_same(encode_uint(100), uint8_vector::from_hex("1864"));
            test_same(encode_uint(255), uint8_vector::from_hex("18FF"));
            test_same(encode_uint(256), uint8_vector::from_hex("190100"));
            test_same(encode_uint(1000), uint8_vector::from_hex("1903E8"));
            test_same(encode_uint(65535), uint8_vector::from_hex("19FFFF"));
            test_same(encode_uint(65536), uint8_vector::from_hex("1A00010000"));
            test_same(encode_uint(1000000), uint8_vector::from_hex("1A000F4240"));
            test_same(encode_uint(4294967295ULL), uint8_vector::from_hex("1AFFFFFFFF"));
            test_same(encode_uint(4294967296ULL), uint8_vector::from_hex("1B0000000100000000"));
            test_same(encode_uint(1000000000000ULL), uint8_vector::from_hex("1B000000E8D4A51000"));
            test_same(encode_uint(18446744073709551615ULL), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
        };
        "negative integers use the shortest form"_test = [] {
            // the argument is -1 - n
            test_same(encode_nint(0), uint8_vector::from_hex("20"));
            test_same(encode_nint(9), uint8_vector::from_hex("29"));
            test_same(encode_nint(23), uint8_vector::from_hex("37"));
            test_same(encode_nint(24), uint8_vector::from_hex("3818"));
            test_same(encode_nint(99), uint8_vector::from_hex("3863"));
            test_same(encode_nint(255), uint8_vector::from_hex("38FF"));
            test_same(encode_nint(256), uint8_vector::from_hex("390100"));
            test_same(encode_nint(999), uint8_vector::from_hex("3903E7"));
            test_same(encode_nint(18446744073709551615ULL), uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"));
        };
        "strings"_test = [] {
            encoder enc {};
            enc.text("");
            enc.text("a");
            enc.text("IETF");
            enc.bytes(uint8_vector {});
            enc.bytes(uint8_vector::from_hex("01020304"));
            test_same(enc.cbor(), uint8_vector::from_hex("606161644945544640" "4401020304"));
        };
        "long strings"_test = [] {
            const std::string text(300, 'x');
            encoder enc {};
            enc.text(text);
            test_same(enc.cbor().size(), 303);
            test_same(buffer { enc.cbor() }.subbuf(0, 3), buffer { uint8_vector::from_hex("79012C") });
        };
        "containers and specials"_test = [] {
            encoder enc {};
            enc.array(3).uint(1).s_false().s_null();
            enc.map(1).text("a").s_true();
            enc.tag(24).bytes(uint8_vector::from_hex("00"));
            enc.s_undefined();
            test_same(enc.cbor(), uint8_vector::from_hex("8301F4F6" "A16161F5" "D8184100" "F7"));
        };
        "raw items"_test = [] {
            encoder inner {};
            inner.array(2).uint(1).uint(2);
            encoder outer {};
            outer.array(2).raw_cbor(inner.cbor()).uint(500);
            test_same(outer.cbor(), uint8_vector::from_hex("82820102" "1901F4"));
        };
    };
};
