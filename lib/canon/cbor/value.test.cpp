/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <canon/cbor/value.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;
using namespace canon_cbor::cbor;

suite cbor_value_suite = [] {
    "cbor::value"_test = [] {
        "integers"_test = [] {
            test_same(value::from_int(5).uint(), 5);
            test_same(value::from_int(-1).nint_raw(), 0);
            test_same(value::from_int(-500).nint_raw(), 499);
            test_same(value::from_int(std::numeric_limits<int64_t>::min()).nint_raw(), static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
            expect(value::from_int(0) == value::from_uint(0));
            expect(!(value::from_int(-1) == value::from_uint(0)));
        };
        "accessors check the type"_test = [] {
            const auto v = value::from_text("abc");
            test_same(v.text(), std::string { "abc" });
            expect_throws_kind<decode_error>([&] { v.uint(); }, error_kind::unexpected_type);
            expect_throws_kind<decode_error>([&] { v.bytes(); }, error_kind::unexpected_type);
            expect_throws_kind<decode_error>([&] { v.map(); }, error_kind::unexpected_type);
            expect_throws_kind<decode_error>([&] { value::null().as_bool(); }, error_kind::unexpected_type);
            expect_throws_kind<decode_error>([] { cbor::array {}.at(0); }, error_kind::unexpected_type);
        };
        "specials"_test = [] {
            expect(value {}.is_null());
            expect(value::undefined().is_undefined());
            expect(!value::undefined().is_null());
            expect(value::boolean(true).is_bool());
            expect(value::boolean(true).as_bool());
            expect(!value::boolean(false).as_bool());
            expect(!value::null().is_bool());
            expect(throws([] { value { special_val::one_byte }; }));
        };
        "map equality ignores the entry order"_test = [] {
            const value a { cbor::map { { value::from_uint(1), value::from_text("x") }, { value::from_text("k"), value::null() } } };
            const value b { cbor::map { { value::from_text("k"), value::null() }, { value::from_uint(1), value::from_text("x") } } };
            const value c { cbor::map { { value::from_text("k"), value::null() }, { value::from_uint(1), value::from_text("y") } } };
            expect(a == b);
            expect(!(a == c));
            expect(!(a == value { cbor::map {} }));
            const auto *found = a.map().find(value::from_text("k"));
            expect(found != nullptr);
            expect(a.map().find(value::from_uint(2)) == nullptr);
        };
        "array equality respects the order"_test = [] {
            const value a { cbor::array { value::from_uint(1), value::from_uint(2) } };
            const value b { cbor::array { value::from_uint(2), value::from_uint(1) } };
            expect(!(a == b));
            expect(a == value { cbor::array { value::from_uint(1), value::from_uint(2) } });
        };
        "tags"_test = [] {
            const value t { tag { 24, value::from_bytes(uint8_vector::from_hex("00")) } };
            test_same(t.tag().id(), 24);
            test_same(t.tag().val(), value::from_bytes(uint8_vector::from_hex("00")));
            expect(!(t == value { tag { 25, value::from_bytes(uint8_vector::from_hex("00")) } }));
        };
        "stringify"_test = [] {
            test_same(stringify(value::from_int(5)), std::string { "I 5" });
            test_same(stringify(value::from_int(-3)), std::string { "I -3" });
            test_same(stringify(value::from_nint_raw(std::numeric_limits<uint64_t>::max())), std::string { "I -18446744073709551616" });
            test_same(stringify(value::from_bytes(uint8_vector::from_hex("0102"))), std::string { "B #0102" });
            test_same(stringify(value::from_bytes(uint8_vector::from_hex("6162"))), std::string { "B #6162 ('ab')" });
            test_same(stringify(value::from_text("abc")), std::string { "T 'abc'" });
            test_same(stringify(value { cbor::array { value::from_uint(1), value::from_text("a") } }), std::string { "[I 1, T 'a']" });
            test_same(stringify(value { cbor::map { { value::from_uint(1), value::boolean(true) } } }), std::string { "{I 1: true}" });
            test_same(stringify(value { tag { 2, value::from_bytes(uint8_vector::from_hex("01")) } }), std::string { "TAG 2 B #01" });
            test_same(stringify(value::null()), std::string { "null" });
            test_same(stringify(value::undefined()), std::string { "undefined" });
            test_same(fmt::format("{}", value { cbor::array {} }), std::string { "[]" });
        };
    };
};
