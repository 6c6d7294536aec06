/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/cbor/canonical.hpp>
#include <canon/cbor/decoder.hpp>

namespace canon_cbor::cbor {
    // A strict single-pass parser accepting only the canonical form of each item.
    // Every check happens before the corresponding allocation or recursion.
    struct decoder {
        decoder(const buffer data, const decode_options &opts):
            _data { data }, _opts { opts }
        {
        }

        bool done() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t pos() const noexcept
        {
            return _pos;
        }

        value read()
        {
            return _read(0);
        }
    private:
        struct header {
            size_t offset;
            major_type typ;
            uint8_t info;
            uint64_t arg;
        };

        const buffer _data;
        const decode_options &_opts;
        size_t _pos = 0;

        size_t _remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        [[noreturn]] static void _fail(const error_kind kind, const size_t offset, const std::string_view msg)
        {
            throw decode_error(kind, msg, offset);
        }

        uint64_t _read_be(const size_t offset, const size_t num_bytes)
        {
            if (_remaining() < num_bytes) [[unlikely]]
                _fail(error_kind::incomplete, offset, fmt::format("the header needs {} more bytes but only {} remain", num_bytes, _remaining()));
            uint64_t val = 0;
            for (size_t i = 0; i < num_bytes; ++i)
                val = (val << 8) | _data[_pos++];
            return val;
        }

        header _read_header()
        {
            if (done()) [[unlikely]]
                _fail(error_kind::incomplete, _pos, "expected an item but reached the end of input");
            header h { _pos, static_cast<major_type>(_data[_pos] >> 5), static_cast<uint8_t>(_data[_pos] & 0x1F), 0 };
            ++_pos;
            if (h.typ == major_type::simple) {
                switch (h.info) {
                    case 24:
                        h.arg = _read_be(h.offset, 1);
                        if (h.arg < 32) [[unlikely]]
                            _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("simple value {} must use the one-byte form", h.arg));
                        _fail(error_kind::unsupported_item, h.offset, fmt::format("unassigned simple value {}", h.arg));
                    case 25:
                    case 26:
                    case 27:
                        _fail(error_kind::unsupported_item, h.offset, "floating-point values are not supported");
                    case 28:
                    case 29:
                    case 30:
                        _fail(error_kind::malformed, h.offset, fmt::format("reserved additional information value {}", h.info));
                    case 31:
                        _fail(error_kind::malformed, h.offset, "unexpected break");
                    default:
                        if (h.info < static_cast<uint8_t>(special_val::s_false)) [[unlikely]]
                            _fail(error_kind::unsupported_item, h.offset, fmt::format("unassigned simple value {}", h.info));
                        h.arg = h.info;
                        return h;
                }
            }
            switch (h.info) {
                case 24:
                    h.arg = _read_be(h.offset, 1);
                    if (h.arg < 24) [[unlikely]]
                        _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("argument {} encoded in 1 byte instead of 0", h.arg));
                    break;
                case 25:
                    h.arg = _read_be(h.offset, 2);
                    if (h.arg <= 0xFF) [[unlikely]]
                        _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("argument {} encoded in 2 bytes", h.arg));
                    break;
                case 26:
                    h.arg = _read_be(h.offset, 4);
                    if (h.arg <= 0xFFFF) [[unlikely]]
                        _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("argument {} encoded in 4 bytes", h.arg));
                    break;
                case 27:
                    h.arg = _read_be(h.offset, 8);
                    if (h.arg <= 0xFFFFFFFFULL) [[unlikely]]
                        _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("argument {} encoded in 8 bytes", h.arg));
                    break;
                case 28:
                case 29:
                case 30:
                    _fail(error_kind::malformed, h.offset, fmt::format("reserved additional information value {}", h.info));
                case 31:
                    if (h.typ == major_type::uint || h.typ == major_type::nint || h.typ == major_type::tag) [[unlikely]]
                        _fail(error_kind::malformed, h.offset, fmt::format("{} items cannot have an indefinite length", h.typ));
                    _fail(error_kind::non_canonical_encoding, h.offset, fmt::format("indefinite-length {} items are not allowed", h.typ));
                default:
                    h.arg = h.info;
                    break;
            }
            return h;
        }

        buffer _read_payload(const header &h)
        {
            if (h.arg > _remaining()) [[unlikely]]
                _fail(error_kind::incomplete, h.offset, fmt::format("{} of {} bytes extends beyond the end of input with {} bytes remaining", h.typ, h.arg, _remaining()));
            const auto res = _data.subbuf(_pos, h.arg);
            _pos += h.arg;
            return res;
        }

        value _read(const size_t depth)
        {
            if (depth > _opts.max_depth) [[unlikely]]
                _fail(error_kind::depth_exceeded, _pos, fmt::format("nesting level {} is above the limit of {}", depth, _opts.max_depth));
            const auto h = _read_header();
            switch (h.typ) {
                case major_type::uint:
                    return value::from_uint(h.arg);
                case major_type::nint:
                    return value::from_nint_raw(h.arg);
                case major_type::bytes:
                    return value::from_bytes(_read_payload(h));
                case major_type::text: {
                    const auto text = _read_payload(h);
                    if (!is_utf8(text)) [[unlikely]]
                        _fail(error_kind::malformed, h.offset, "text string is not valid UTF-8");
                    return value::from_text(text);
                }
                case major_type::array: {
                    // every item takes at least one byte
                    if (h.arg > _remaining()) [[unlikely]]
                        _fail(error_kind::incomplete, h.offset, fmt::format("array of {} items cannot fit into {} remaining bytes", h.arg, _remaining()));
                    array items {};
                    items.reserve(h.arg);
                    for (uint64_t i = 0; i < h.arg; ++i)
                        items.emplace_back(_read(depth + 1));
                    return items;
                }
                case major_type::map:
                    return _read_map(h, depth);
                case major_type::tag: {
                    if (_opts.allowed_tags && !_opts.allowed_tags->count(h.arg)) [[unlikely]]
                        _fail(error_kind::unsupported_item, h.offset, fmt::format("tag {} is not allowed", h.arg));
                    return tag { h.arg, _read(depth + 1) };
                }
                case major_type::simple:
                    return value { static_cast<special_val>(h.arg) };
                default:
                    _fail(error_kind::malformed, h.offset, fmt::format("unsupported major type: {}", h.typ));
            }
        }

        value _read_map(const header &h, const size_t depth)
        {
            // every entry takes at least two bytes
            if (h.arg > _remaining() / 2) [[unlikely]]
                _fail(error_kind::incomplete, h.offset, fmt::format("map of {} entries cannot fit into {} remaining bytes", h.arg, _remaining()));
            map entries {};
            entries.reserve(h.arg);
            buffer prev_key {};
            for (uint64_t i = 0; i < h.arg; ++i) {
                const auto key_offset = _pos;
                auto key = _read(depth + 1);
                // a canonical key has exactly one encoding so comparing the raw bytes is exact
                const auto key_bytes = _data.subbuf(key_offset, _pos - key_offset);
                if (i > 0) {
                    const auto cmp = compare_keys(prev_key, key_bytes);
                    if (cmp == std::strong_ordering::equal) [[unlikely]]
                        _fail(error_kind::duplicate_map_key, key_offset, fmt::format("duplicate map key {}", key));
                    if (cmp == std::strong_ordering::greater) [[unlikely]]
                        _fail(error_kind::non_canonical_encoding, key_offset, fmt::format("map key {} is out of the canonical order", key));
                }
                prev_key = key_bytes;
                auto val = _read(depth + 1);
                entries.emplace_back(std::move(key), std::move(val));
            }
            return entries;
        }
    };

    decoded decode(const buffer data, const decode_options &opts)
    {
        decoder dec { data, opts };
        auto val = dec.read();
        return decoded { std::move(val), dec.pos() };
    }

    value decode_exact(const buffer data, const decode_options &opts)
    {
        decoder dec { data, opts };
        auto val = dec.read();
        if (!dec.done()) [[unlikely]]
            throw decode_error(error_kind::trailing_bytes, fmt::format("{} bytes remain after the item", data.size() - dec.pos()), dec.pos());
        return val;
    }

    vector<value> decode_all(const buffer data, const decode_options &opts)
    {
        vector<value> items {};
        decoder dec { data, opts };
        while (!dec.done())
            items.emplace_back(dec.read());
        return items;
    }
}
