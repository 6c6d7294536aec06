/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/array.hpp>
#include <canon/common/bytes.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;

suite common_bytes_suite = [] {
    "common::bytes"_test = [] {
        "from_hex"_test = [] {
            const auto v = uint8_vector::from_hex("00ff7Fa1");
            test_same(v.size(), 4);
            test_same(v[0], 0x00);
            test_same(v[1], 0xFF);
            test_same(v[2], 0x7F);
            test_same(v[3], 0xA1);
            expect(throws([] { uint8_vector::from_hex("0"); }));
            expect(throws([] { uint8_vector::from_hex("zz"); }));
            expect(throws([] { uint8_vector::from_hex("\xC3\xA9"); }));
            expect(throws([] { uint8_vector::from_hex("0\xFF"); }));
        };
        "format"_test = [] {
            test_same(fmt::format("{}", uint8_vector::from_hex("deadbeef")), std::string { "DEADBEEF" });
            test_same(fmt::format("{}", uint8_vector {}), std::string {});
        };
        "ordering"_test = [] {
            const auto a = uint8_vector::from_hex("0102");
            const auto b = uint8_vector::from_hex("0103");
            const auto c = uint8_vector::from_hex("010200");
            expect(a < b);
            expect(a < c);
            expect(c < b);
            expect(uint8_vector {} < a);
            expect(a == uint8_vector::from_hex("0102"));
            expect(buffer {} == buffer {});
        };
        "subbuf"_test = [] {
            const auto v = uint8_vector::from_hex("00010203");
            const buffer buf = v;
            test_same(buf.subbuf(1, 2), buffer { uint8_vector::from_hex("0102") });
            test_same(buf.subbuf(4).size(), 0);
            expect(throws([&] { buf.subbuf(3, 2); }));
            expect(throws([&] { buf.subbuf(5); }));
        };
        "append"_test = [] {
            uint8_vector v {};
            v << 0x01 << uint8_vector::from_hex("0203");
            test_same(v, uint8_vector::from_hex("010203"));
        };
        "byte_array"_test = [] {
            const auto a = byte_array<3>::from_hex("0A0B0C");
            test_same(fmt::format("{}", a), std::string { "0A0B0C" });
            byte_array<3> b {};
            b = static_cast<buffer>(uint8_vector::from_hex("0A0B0C"));
            expect(a == b);
            expect(throws([] { byte_array<3> { 0x01, 0x02 }; }));
            expect(throws([] { byte_array<2>::from_hex("010203"); }));
        };
    };
};
