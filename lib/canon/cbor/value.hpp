/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_VALUE_HPP
#define CANON_CBOR_CBOR_VALUE_HPP

#include <memory>
#include <source_location>
#include <string>
#include <utility>
#include <variant>
#include <canon/common/bytes.hpp>
#include <canon/container.hpp>
#include <canon/cbor/error.hpp>
#include <canon/cbor/types.hpp>

namespace canon_cbor::cbor {
    struct value;

    using map_entry = std::pair<value, value>;

    struct array: vector<value> {
        using base_type = vector<value>;
        using base_type::base_type;

        const value &at(size_t idx, const std::source_location &loc=std::source_location::current()) const;
    };

    // entries are kept in the order of insertion; the encoder applies the canonical order
    struct map: vector<map_entry> {
        using base_type = vector<map_entry>;
        using base_type::base_type;

        // nullptr when no entry has an equal key
        const value *find(const value &key) const;
        // entries are compared as sets since the keys of a well-formed map are unique
        bool operator==(const map &o) const;
    };

    struct tag {
        tag(uint64_t id, value val);

        uint64_t id() const noexcept
        {
            return _id;
        }

        const value &val() const noexcept
        {
            return *_val;
        }

        bool operator==(const tag &o) const;
    private:
        uint64_t _id;
        std::shared_ptr<const value> _val;
    };

    struct value {
        using storage_type = std::variant<uint64_t, uint8_vector, std::string, cbor::array, cbor::map, cbor::tag, special_val>;

        static value from_uint(const uint64_t val)
        {
            return { major_type::uint, val };
        }

        // raw is the CBOR argument: the represented integer is -1 - raw
        static value from_nint_raw(const uint64_t raw)
        {
            return { major_type::nint, raw };
        }

        static value from_int(const int64_t val)
        {
            if (val >= 0)
                return from_uint(static_cast<uint64_t>(val));
            return from_nint_raw(static_cast<uint64_t>(-(val + 1)));
        }

        static value from_bytes(const buffer bytes)
        {
            return { major_type::bytes, uint8_vector { bytes } };
        }

        static value from_text(const std::string_view text)
        {
            return { major_type::text, std::string { text } };
        }

        static value boolean(const bool val)
        {
            return value { val ? special_val::s_true : special_val::s_false };
        }

        static value null()
        {
            return value { special_val::s_null };
        }

        static value undefined()
        {
            return value { special_val::s_undefined };
        }

        value(): value { special_val::s_null }
        {
        }

        value(cbor::array arr): _type { major_type::array }, _storage { std::move(arr) }
        {
        }

        value(cbor::map m): _type { major_type::map }, _storage { std::move(m) }
        {
        }

        value(cbor::tag t): _type { major_type::tag }, _storage { std::move(t) }
        {
        }

        value(const special_val sv);

        major_type type() const noexcept
        {
            return _type;
        }

        bool is_null() const noexcept
        {
            return _type == major_type::simple && std::get<special_val>(_storage) == special_val::s_null;
        }

        bool is_undefined() const noexcept
        {
            return _type == major_type::simple && std::get<special_val>(_storage) == special_val::s_undefined;
        }

        bool is_bool() const noexcept
        {
            if (_type != major_type::simple)
                return false;
            const auto sv = std::get<special_val>(_storage);
            return sv == special_val::s_true || sv == special_val::s_false;
        }

        uint64_t uint() const
        {
            return _get<uint64_t>(major_type::uint);
        }

        uint64_t nint_raw() const
        {
            return _get<uint64_t>(major_type::nint);
        }

        const uint8_vector &bytes() const
        {
            return _get<uint8_vector>(major_type::bytes);
        }

        const std::string &text() const
        {
            return _get<std::string>(major_type::text);
        }

        const cbor::array &array() const
        {
            return _get<cbor::array>(major_type::array);
        }

        const cbor::map &map() const
        {
            return _get<cbor::map>(major_type::map);
        }

        const cbor::tag &tag() const
        {
            return _get<cbor::tag>(major_type::tag);
        }

        special_val special() const
        {
            return _get<special_val>(major_type::simple);
        }

        bool as_bool() const;

        bool operator==(const value &o) const;
    private:
        major_type _type;
        storage_type _storage;

        template<typename T>
        value(const major_type type, T &&val): _type { type }, _storage { std::forward<T>(val) }
        {
        }

        template<typename T>
        const T &_get(const major_type exp_type) const
        {
            if (_type != exp_type) [[unlikely]]
                throw decode_error(error_kind::unexpected_type, fmt::format("expected {} but got {}", exp_type, _type));
            return std::get<T>(_storage);
        }
    };

    inline tag::tag(const uint64_t id, value val): _id { id }, _val { std::make_shared<const value>(std::move(val)) }
    {
    }

    inline bool tag::operator==(const tag &o) const
    {
        return _id == o._id && *_val == *o._val;
    }

    // single-line diagnostic notation: I 5, I -3, B #0102, T 'abc', [...], {k: v}, TAG n ...
    extern std::string stringify(const value &v);
}

namespace fmt {
    template<>
    struct formatter<canon_cbor::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", canon_cbor::cbor::stringify(v));
        }
    };

    template<>
    struct formatter<canon_cbor::cbor::array>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", canon_cbor::cbor::stringify(canon_cbor::cbor::value { v }));
        }
    };
}

#endif // !CANON_CBOR_CBOR_VALUE_HPP
