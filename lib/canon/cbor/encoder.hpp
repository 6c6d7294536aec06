/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_ENCODER_HPP
#define CANON_CBOR_CBOR_ENCODER_HPP

#include <limits>
#include <canon/common/bytes.hpp>
#include <canon/cbor/types.hpp>

namespace canon_cbor::cbor {
    // Append-only writer of CBOR headers and payloads.
    // Only definite lengths and the shortest argument forms can be produced.
    struct encoder {
        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map(const size_t sz)
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            _encode_uint_item(major_type::nint, val);
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        // the caller guarantees that buf is a sequence of complete canonical items
        encoder &raw_cbor(const buffer buf)
        {
            _encode_data(buf);
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_undefined()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
            return *this;
        }

        encoder &s_false()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_false));
            return *this;
        }

        encoder &s_true()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_true));
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    protected:
        void _encode_data(const buffer buf)
        {
            _buf.insert(_buf.end(), buf.begin(), buf.end());
        }
    private:
        uint8_vector _buf {};

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _encode_data(buffer::from(host_to_net<uint16_t>(static_cast<uint16_t>(val))));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _encode_data(buffer::from(host_to_net<uint32_t>(static_cast<uint32_t>(val))));
            } else {
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _encode_data(buffer::from(host_to_net<uint64_t>(val)));
            }
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (special & 0x1F));
        }
    };
}

#endif // !CANON_CBOR_CBOR_ENCODER_HPP
