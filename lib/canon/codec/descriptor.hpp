/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CODEC_DESCRIPTOR_HPP
#define CANON_CBOR_CODEC_DESCRIPTOR_HPP

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <canon/cbor/value.hpp>

/*
 * Compile-time mapping metadata. A type opts into the canonical codec with static members:
 *
 *   struct person {
 *       std::string name;
 *       std::optional<uint64_t> age;
 *       uint64_t score = 0;
 *
 *       static constexpr auto cbor_fields = codec::fields(
 *           codec::field("name", &person::name),
 *           codec::field("age", &person::age),
 *           codec::field(3, &person::score).skip_default()
 *       );
 *   };
 *
 * cbor_elements = codec::elements(&T::a, ...) describes a positional type instead,
 * and cbor_variant = codec::variant_key { "Name" } marks an alternative of a sum type.
 */

namespace canon_cbor::codec {
    // A text key or an unsigned integer key of a record field or of a sum type alternative.
    struct field_key {
        constexpr field_key(const char *name): _name { name }, _text { true }
        {
        }

        template<std::unsigned_integral I>
        constexpr field_key(const I id): _id { id }, _text { false }
        {
        }

        template<std::signed_integral I>
        consteval field_key(const I id): _id { static_cast<uint64_t>(id) }, _text { false }
        {
            if (id < 0)
                throw "integer keys must be non-negative";
        }

        constexpr bool is_text() const noexcept
        {
            return _text;
        }

        constexpr std::string_view name() const noexcept
        {
            return _name;
        }

        constexpr uint64_t id() const noexcept
        {
            return _id;
        }

        constexpr bool operator==(const field_key &o) const noexcept
        {
            return _text == o._text && (_text ? _name == o._name : _id == o._id);
        }

        bool matches(const cbor::value &key) const
        {
            if (_text)
                return key.type() == cbor::major_type::text && key.text() == _name;
            return key.type() == cbor::major_type::uint && key.uint() == _id;
        }

        cbor::value to_value() const
        {
            if (_text)
                return cbor::value::from_text(_name);
            return cbor::value::from_uint(_id);
        }

        // the segment used in error paths
        std::string to_string() const
        {
            if (_text)
                return std::string { _name };
            return fmt::format("{}", _id);
        }
    private:
        std::string_view _name {};
        uint64_t _id = 0;
        bool _text;
    };

    using variant_key = field_key;

    enum class presence: uint8_t {
        required,
        optional,
        skip_default
    };

    template<typename T>
    struct is_optional: std::false_type {};

    template<typename T>
    struct is_optional<std::optional<T>>: std::true_type {};

    template<typename T>
    constexpr bool is_optional_v = is_optional<T>::value;

    template<typename T>
    T value_initialized()
    {
        return T {};
    }

    template<typename C, typename M, presence P>
    struct field_desc {
        using class_type = C;
        using member_type = M;
        using default_func = M (*)();
        static constexpr presence policy = P;

        field_key key;
        M C::*member;
        default_func make_default = nullptr;

        // omits the field when it equals the value-initialized M
        constexpr field_desc<C, M, presence::skip_default> skip_default() const
        {
            static_assert(P == presence::required, "skip_default applies only to required non-optional fields");
            return { key, member, &value_initialized<M> };
        }

        // omits the field when it equals the value returned by make_def
        constexpr field_desc<C, M, presence::skip_default> skip_default(const default_func make_def) const
        {
            static_assert(P == presence::required, "skip_default applies only to required non-optional fields");
            return { key, member, make_def };
        }
    };

    // optional-ness follows the member type: std::optional members are omitted when empty
    template<typename C, typename M>
    constexpr auto field(const field_key key, M C::*member)
    {
        if constexpr (is_optional_v<M>)
            return field_desc<C, M, presence::optional> { key, member };
        else
            return field_desc<C, M, presence::required> { key, member };
    }

    template<typename... Fs>
    struct field_list {
        std::tuple<Fs...> items;

        static constexpr size_t size() noexcept
        {
            return sizeof...(Fs);
        }

        constexpr bool has_unique_keys() const
        {
            return std::apply([](const auto &...f) {
                const field_key keys[] { f.key..., field_key { 0U } };
                for (size_t i = 0; i < sizeof...(Fs); ++i) {
                    for (size_t j = i + 1; j < sizeof...(Fs); ++j) {
                        if (keys[i] == keys[j])
                            return false;
                    }
                }
                return true;
            }, items);
        }
    };

    template<typename... Fs>
    constexpr field_list<Fs...> fields(const Fs &...f)
    {
        return { std::tuple<Fs...> { f... } };
    }

    template<typename... Ms>
    struct element_list {
        std::tuple<Ms...> items;

        static constexpr size_t size() noexcept
        {
            return sizeof...(Ms);
        }
    };

    template<typename... Ms>
        requires (std::is_member_object_pointer_v<Ms> && ...)
    constexpr element_list<Ms...> elements(const Ms ...m)
    {
        return { std::tuple<Ms...> { m... } };
    }

    template<typename T>
    concept has_fields_c = requires { T::cbor_fields.items; };

    template<typename T>
    concept has_elements_c = requires { T::cbor_elements.items; };

    template<typename T>
    concept has_variant_key_c = requires { { T::cbor_variant } -> std::convertible_to<variant_key>; };

    template<typename Tuple, typename F>
    constexpr void for_each_indexed(const Tuple &t, F &&f)
    {
        [&]<size_t... I>(std::index_sequence<I...>) {
            (f(std::get<I>(t), I), ...);
        }(std::make_index_sequence<std::tuple_size_v<Tuple>> {});
    }
}

#endif // !CANON_CBOR_CODEC_DESCRIPTOR_HPP
