/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <canon/cbor/canonical.hpp>
#include <canon/cbor/decoder.hpp>

namespace canon_cbor::cbor {
    struct encoded_entry {
        uint8_vector key;
        const value *val;
    };

    static void encode_item(encoder &enc, const value &v, size_t depth);

    static void encode_map(encoder &enc, const map &m, const size_t depth)
    {
        vector<encoded_entry> entries {};
        entries.reserve(m.size());
        for (const auto &[k, v]: m) {
            encoder key_enc {};
            encode_item(key_enc, k, depth + 1);
            entries.emplace_back(std::move(key_enc.cbor()), &v);
        }
        std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
            return compare_keys(a.key, b.key) == std::strong_ordering::less;
        });
        for (size_t i = 1; i < entries.size(); ++i) {
            if (entries[i - 1].key == entries[i].key) [[unlikely]]
                throw invariant_error(fmt::format("a map passed to the encoder contains a duplicate key: {}", entries[i].key));
        }
        enc.map(entries.size());
        for (const auto &e: entries) {
            enc.raw_cbor(e.key);
            encode_item(enc, *e.val, depth + 1);
        }
    }

    static void encode_item(encoder &enc, const value &v, const size_t depth)
    {
        // the decoder's default limit: nothing deeper can be decoded with the default options
        if (depth > default_max_depth) [[unlikely]]
            throw invariant_error(fmt::format("nesting level {} is above the limit of {}", depth, default_max_depth));
        switch (v.type()) {
            case major_type::uint:
                enc.uint(v.uint());
                break;
            case major_type::nint:
                enc.nint(v.nint_raw());
                break;
            case major_type::bytes:
                enc.bytes(v.bytes());
                break;
            case major_type::text:
                if (!is_utf8(v.text())) [[unlikely]]
                    throw invariant_error(fmt::format("text string #{} is not valid UTF-8", buffer { v.text() }));
                enc.text(v.text());
                break;
            case major_type::array:
                enc.array(v.array().size());
                for (const auto &item: v.array())
                    encode_item(enc, item, depth + 1);
                break;
            case major_type::map:
                encode_map(enc, v.map(), depth);
                break;
            case major_type::tag:
                enc.tag(v.tag().id());
                encode_item(enc, v.tag().val(), depth + 1);
                break;
            case major_type::simple:
                switch (v.special()) {
                    case special_val::s_false: enc.s_false(); break;
                    case special_val::s_true: enc.s_true(); break;
                    case special_val::s_null: enc.s_null(); break;
                    case special_val::s_undefined: enc.s_undefined(); break;
                    default: throw invariant_error(fmt::format("unsupported simple value: {}", v.special()));
                }
                break;
            default:
                throw invariant_error(fmt::format("unsupported major type: {}", v.type()));
        }
    }

    void encode(encoder &enc, const value &v)
    {
        encode_item(enc, v, 0);
    }

    uint8_vector encode(const value &v)
    {
        encoder enc {};
        encode(enc, v);
        return std::move(enc.cbor());
    }
}
