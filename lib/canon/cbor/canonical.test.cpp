/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <canon/cbor/canonical.hpp>
#include <canon/cbor/decoder.hpp>
#include <canon/common/test.hpp>
#include <canon/logger.hpp>

using namespace canon_cbor;
using namespace canon_cbor::cbor;

namespace {
    value nested_arrays(const size_t levels)
    {
        auto v = value::from_uint(0);
        for (size_t i = 0; i < levels; ++i)
            v = value { cbor::array { v } };
        return v;
    }

    void test_round_trip(const value &v, const std::source_location &loc=std::source_location::current())
    {
        const auto bytes = encode(v);
        const auto decoded = decode_exact(bytes);
        test_same(decoded, v, loc);
        test_same(encode(decoded), bytes, loc);
    }
}

suite cbor_canonical_suite = [] {
    "cbor::canonical"_test = [] {
        "compare_keys"_test = [] {
            const auto k_10 = uint8_vector::from_hex("0A");
            const auto k_100 = uint8_vector::from_hex("1864");
            const auto k_m1 = uint8_vector::from_hex("20");
            expect(compare_keys(k_10, k_m1) == std::strong_ordering::less);
            expect(compare_keys(k_m1, k_100) == std::strong_ordering::less);
            expect(compare_keys(k_100, k_10) == std::strong_ordering::greater);
            expect(compare_keys(k_10, uint8_vector::from_hex("0A")) == std::strong_ordering::equal);
            // lexicographic order would put 1864 before 20
            expect(uint8_vector::from_hex("1864") < uint8_vector::from_hex("20"));
        };
        "scalars"_test = [] {
            test_same(encode(value::from_int(-1)), uint8_vector::from_hex("20"));
            test_same(encode(value::from_int(1000)), uint8_vector::from_hex("1903E8"));
            test_same(encode(value::from_text("IETF")), uint8_vector::from_hex("6449455446"));
            test_same(encode(value::boolean(false)), uint8_vector::from_hex("F4"));
            test_same(encode(value::null()), uint8_vector::from_hex("F6"));
            test_same(encode(value::undefined()), uint8_vector::from_hex("F7"));
            test_same(encode(value { tag { 1, value::from_uint(1363896240) } }), uint8_vector::from_hex("C11A514B67B0"));
        };
        "integer keys are ordered by the length of the encoding first"_test = [] {
            const value v { cbor::map {
                { value::from_int(100), value::from_uint(2) },
                { value::from_int(-1), value::from_uint(3) },
                { value::from_int(10), value::from_uint(1) }
            } };
            test_same(encode(v), uint8_vector::from_hex("A3" "0A01" "2003" "186402"));
        };
        "text keys"_test = [] {
            const value v { cbor::map {
                { value::from_text("aa"), value::from_uint(3) },
                { value::from_text("b"), value::from_uint(2) },
                { value::from_text("a"), value::from_uint(1) }
            } };
            test_same(encode(v), uint8_vector::from_hex("A3" "616101" "616202" "62616103"));
        };
        "mixed keys"_test = [] {
            const value v { cbor::map {
                { value::from_text("z"), value::from_uint(4) },
                { value { cbor::array { value::from_uint(1) } }, value::from_uint(5) },
                { value::boolean(false), value::from_uint(3) },
                { value::from_int(-100), value::from_uint(2) },
                { value::from_uint(10), value::from_uint(1) }
            } };
            test_same(encode(v), uint8_vector::from_hex("A5" "0A01" "F403" "386302" "617A04" "810105"));
        };
        "insertion order does not matter"_test = [] {
            const value a { cbor::map { { value::from_text("x"), value::from_uint(1) }, { value::from_uint(7), value::from_text("y") } } };
            const value b { cbor::map { { value::from_uint(7), value::from_text("y") }, { value::from_text("x"), value::from_uint(1) } } };
            test_same(encode(a), encode(b));
            test_same(encode(a), uint8_vector::from_hex("A2" "076179" "617801"));
        };
        "nested maps are sorted too"_test = [] {
            const value v { cbor::array { value { cbor::map { { value::from_uint(2), value::null() }, { value::from_uint(1), value::null() } } } } };
            test_same(encode(v), uint8_vector::from_hex("81A201F602F6"));
        };
        "duplicate keys"_test = [] {
            logger::reset_last_error();
            const value v { cbor::map { { value::from_uint(1), value::null() }, { value::from_uint(1), value::boolean(true) } } };
            expect(throws<invariant_error>([&] { encode(v); }));
            // reported to the caller only
            expect(!logger::last_error());
        };
        "invalid UTF-8 text is not encoded"_test = [] {
            expect(throws<invariant_error>([] { encode(value::from_text("\xC3\x28")); }));
            expect(throws<invariant_error>([] { encode(value::from_text("\xED\xA0\x80")); }));
            const value in_key { cbor::map { { value::from_text("\xFF"), value::null() } } };
            expect(throws<invariant_error>([&] { encode(in_key); }));
            const value in_tag { tag { 0, value { cbor::array { value::from_text("ok"), value::from_text("\xC0\x80") } } } };
            expect(throws<invariant_error>([&] { encode(in_tag); }));
            test_same(encode(value::from_text("\xE2\x82\xAC")), uint8_vector::from_hex("63E282AC"));
        };
        "nesting limit"_test = [] {
            test_round_trip(nested_arrays(default_max_depth));
            expect(throws<invariant_error>([] { encode(nested_arrays(default_max_depth + 1)); }));
            auto deep_tags = value::from_uint(0);
            for (size_t i = 0; i < 1000; ++i)
                deep_tags = value { tag { 1, deep_tags } };
            expect(throws<invariant_error>([&] { encode(deep_tags); }));
            // map keys are one level below their map
            const value deep_key { cbor::map { { nested_arrays(default_max_depth), value::null() } } };
            expect(throws<invariant_error>([&] { encode(deep_key); }));
        };
        "integer extremes round trip"_test = [] {
            for (const auto &v: {
                value::from_uint(0), value::from_uint(23), value::from_uint(24), value::from_uint(255), value::from_uint(256),
                value::from_uint(65535), value::from_uint(65536), value::from_uint(4294967295ULL), value::from_uint(4294967296ULL),
                value::from_uint(std::numeric_limits<uint64_t>::max()),
                value::from_int(-1), value::from_int(-24), value::from_int(-25), value::from_int(-257),
                value::from_int(std::numeric_limits<int64_t>::max()), value::from_int(std::numeric_limits<int64_t>::min()),
                value::from_nint_raw(std::numeric_limits<uint64_t>::max())
            }) {
                test_round_trip(v);
            }
            test_same(encode(value::from_int(std::numeric_limits<int64_t>::min())), uint8_vector::from_hex("3B7FFFFFFFFFFFFFFF"));
            test_same(encode(value::from_nint_raw(std::numeric_limits<uint64_t>::max())), uint8_vector::from_hex("3BFFFFFFFFFFFFFFFF"));
        };
        "mixed nested values round trip"_test = [] {
            const value inner_map { cbor::map {
                { value::from_int(-5), value::from_bytes(uint8_vector::from_hex("00FF")) },
                { value::from_text("\xE2\x82\xAC"), value { cbor::array {} } },
                { value::boolean(true), value::undefined() }
            } };
            const value mixed { tag { 258, value { cbor::array {
                inner_map,
                value { cbor::map {} },
                value { tag { 24, value::from_bytes(uint8_vector {}) } },
                value { cbor::array { value { cbor::map { { value::from_uint(1), inner_map } } } } }
            } } } };
            for (const auto &v: {
                value::from_text(""), value::from_text("\xF0\x9F\x98\x80"), value::from_bytes(uint8_vector::from_hex("DEADBEEF")),
                value::null(), value::boolean(false), inner_map, mixed,
                value { cbor::map { { mixed, inner_map }, { inner_map, mixed } } }
            }) {
                test_round_trip(v);
            }
        };
        "every insertion order gives the same bytes"_test = [] {
            const std::array<map_entry, 5> entries {
                map_entry { value::from_uint(10), value::from_uint(1) },
                map_entry { value::from_int(-100), value::null() },
                map_entry { value::from_text("z"), value { cbor::array { value::from_uint(2) } } },
                map_entry { value { cbor::array { value::from_uint(1) } }, value::from_text("arr") },
                map_entry { value::from_bytes(uint8_vector::from_hex("01")), value { cbor::map { { value::from_text("b"), value::from_uint(3) }, { value::from_text("a"), value::from_uint(4) } } } }
            };
            std::array<size_t, 5> order { 0, 1, 2, 3, 4 };
            std::optional<uint8_vector> first {};
            size_t permutations = 0;
            do {
                cbor::map m {};
                for (const auto idx: order)
                    m.emplace_back(entries[idx]);
                const value v { std::move(m) };
                const auto bytes = encode(v);
                if (!first)
                    first = bytes;
                test_same(bytes, *first);
                test_round_trip(v);
                ++permutations;
            } while (std::next_permutation(order.begin(), order.end()));
            test_same(permutations, 120);
        };
        "the output is accepted by the decoder"_test = [] {
            const value v { cbor::map {
                { value::from_text("list"), value { cbor::array { value::from_int(-1000), value::from_bytes(uint8_vector::from_hex("DEADBEEF")) } } },
                { value::from_uint(0), value { tag { 24, value::from_text("t") } } }
            } };
            const auto bytes = encode(v);
            const auto decoded = decode_exact(bytes);
            test_same(decoded, v);
            test_same(encode(decoded), bytes);
        };
    };
};
