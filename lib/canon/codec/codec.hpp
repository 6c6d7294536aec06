/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CODEC_CODEC_HPP
#define CANON_CBOR_CODEC_CODEC_HPP

#include <array>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>
#include <canon/array.hpp>
#include <canon/container.hpp>
#include <canon/cbor/canonical.hpp>
#include <canon/cbor/decoder.hpp>
#include <canon/cbor/value.hpp>
#include <canon/codec/bridge.hpp>
#include <canon/codec/descriptor.hpp>
#include <canon/codec/fwd.hpp>

namespace canon_cbor::codec {
    template<typename T, template<typename...> class Tmpl>
    struct is_specialization: std::false_type {};

    template<template<typename...> class Tmpl, typename... Args>
    struct is_specialization<Tmpl<Args...>, Tmpl>: std::true_type {};

    template<typename T, template<typename...> class Tmpl>
    constexpr bool is_specialization_v = is_specialization<T, Tmpl>::value;

    template<typename T>
    struct is_std_array: std::false_type {};

    template<typename T, size_t N>
    struct is_std_array<std::array<T, N>>: std::true_type {};

    template<typename T>
    struct is_byte_array: std::false_type {};

    template<size_t N>
    struct is_byte_array<byte_array<N>>: std::true_type {};

    template<typename T>
    constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>
        && !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t>
        && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

    template<typename T>
    constexpr bool is_bytes_v = std::is_same_v<T, uint8_vector> || std::is_same_v<T, std::vector<uint8_t>> || is_byte_array<T>::value;

    template<typename T>
    constexpr bool is_tuple_like_v = is_specialization_v<T, std::tuple> || is_specialization_v<T, std::pair> || is_std_array<T>::value;

    template<typename T>
    constexpr bool is_native_map_v = is_specialization_v<T, std::map> || is_specialization_v<T, flat_map>;

    template<typename T>
    struct is_sum_type: std::false_type {};

    template<typename... Alts>
    struct is_sum_type<std::variant<Alts...>>: std::bool_constant<(has_variant_key_c<Alts> && ...)> {};

    template<typename T>
    constexpr bool is_sum_type_v = is_sum_type<T>::value;

    template<typename T>
    constexpr bool dependent_false_v = false;

    template<typename T>
    constexpr bool is_mapped()
    {
        if constexpr (std::is_same_v<T, cbor::value> || std::is_same_v<T, bool> || is_integer_v<T>
                || std::is_same_v<T, std::string> || is_bytes_v<T> || std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (has_fields_c<T> || has_elements_c<T> || bridge::serializable_c<T>) {
            return true;
        } else if constexpr (is_sum_type_v<T>) {
            return true;
        } else if constexpr (is_specialization_v<T, std::optional>) {
            return is_mapped<typename T::value_type>();
        } else if constexpr (is_specialization_v<T, std::vector>) {
            return is_mapped<typename T::value_type>();
        } else if constexpr (is_native_map_v<T>) {
            return is_mapped<typename T::key_type>() && is_mapped<typename T::mapped_type>();
        } else if constexpr (is_std_array<T>::value) {
            return is_mapped<typename T::value_type>();
        } else if constexpr (is_specialization_v<T, std::pair>) {
            return is_mapped<typename T::first_type>() && is_mapped<typename T::second_type>();
        } else if constexpr (is_specialization_v<T, std::tuple>) {
            return []<size_t... I>(std::index_sequence<I...>) {
                return (is_mapped<std::tuple_element_t<I, T>>() && ...);
            }(std::make_index_sequence<std::tuple_size_v<T>> {});
        } else {
            return false;
        }
    }

    // reports whether T has a canonical mapping
    template<typename T>
    concept mapped_c = is_mapped<std::remove_cvref_t<T>>();

    // runs f and relocates its decode errors under the given path segment
    template<typename F>
    void nested(const std::string_view segment, const F &f)
    {
        try {
            f();
        } catch (const cbor::decode_error &ex) {
            throw ex.nested(segment);
        }
    }

    template<typename M>
    void decode_item(M &item, const cbor::array &items, const size_t idx, const cbor::decode_options &opts)
    {
        nested(fmt::format("[{}]", idx), [&] {
            decode_into(item, items[idx], opts);
        });
    }

    template<typename T>
    T decode_int(const cbor::value &v)
    {
        switch (v.type()) {
            case cbor::major_type::uint: {
                const auto raw = v.uint();
                if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) [[unlikely]]
                    throw cbor::decode_error(cbor::error_kind::integer_overflow,
                        fmt::format("{} does not fit into a {}-byte integer", raw, sizeof(T)));
                return static_cast<T>(raw);
            }
            case cbor::major_type::nint: {
                const auto raw = v.nint_raw();
                if constexpr (std::is_signed_v<T>) {
                    // the represented value is -1 - raw, so raw <= max is the same as value >= min
                    if (raw <= static_cast<uint64_t>(std::numeric_limits<T>::max()))
                        return static_cast<T>(-1 - static_cast<int64_t>(raw));
                }
                throw cbor::decode_error(cbor::error_kind::integer_overflow,
                    fmt::format("{} does not fit into a {} {}-byte integer", v, std::is_signed_v<T> ? "signed" : "unsigned", sizeof(T)));
            }
            default:
                throw cbor::decode_error(cbor::error_kind::unexpected_type, fmt::format("expected an integer but got {}", v.type()));
        }
    }

    template<typename C, typename M, presence P>
    void encode_field(cbor::map &m, const C &obj, const field_desc<C, M, P> &f)
    {
        const auto &member = obj.*(f.member);
        if constexpr (P == presence::optional) {
            if (member)
                m.emplace_back(f.key.to_value(), to_value(*member));
        } else if constexpr (P == presence::skip_default) {
            if (!(member == f.make_default()))
                m.emplace_back(f.key.to_value(), to_value(member));
        } else {
            m.emplace_back(f.key.to_value(), to_value(member));
        }
    }

    template<typename C, typename M, presence P>
    void decode_field(C &obj, const field_desc<C, M, P> &f, const cbor::value &v, const cbor::decode_options &opts)
    {
        auto &member = obj.*(f.member);
        nested(f.key.to_string(), [&] {
            if constexpr (P == presence::optional) {
                typename M::value_type item {};
                decode_into(item, v, opts);
                member = std::move(item);
            } else if constexpr (P == presence::skip_default) {
                decode_into(member, v, opts);
                if (member == f.make_default()) [[unlikely]]
                    throw cbor::decode_error(cbor::error_kind::non_canonical_encoding,
                        "a field equal to its default must be omitted");
            } else {
                decode_into(member, v, opts);
            }
        });
    }

    template<typename C, typename M, presence P>
    void decode_absent_field(C &obj, const field_desc<C, M, P> &f)
    {
        auto &member = obj.*(f.member);
        if constexpr (P == presence::optional) {
            member.reset();
        } else if constexpr (P == presence::skip_default) {
            member = f.make_default();
        } else {
            throw cbor::decode_error(cbor::error_kind::missing_required_field,
                fmt::format("required field {} is missing", f.key.to_string()), std::optional<size_t> {}, f.key.to_string());
        }
    }

    template<typename T>
    cbor::value record_to_value(const T &obj)
    {
        static_assert(T::cbor_fields.has_unique_keys(), "record field keys must be unique");
        cbor::map m {};
        m.reserve(T::cbor_fields.size());
        std::apply([&](const auto &...f) {
            (encode_field(m, obj, f), ...);
        }, T::cbor_fields.items);
        return m;
    }

    template<typename T>
    void record_from_value(T &obj, const cbor::value &v, const cbor::decode_options &opts)
    {
        static_assert(T::cbor_fields.has_unique_keys(), "record field keys must be unique");
        constexpr size_t num_fields = T::cbor_fields.size();
        std::array<bool, num_fields> seen {};
        for (const auto &[key, val]: v.map()) {
            bool known = false;
            for_each_indexed(T::cbor_fields.items, [&](const auto &f, const size_t idx) {
                if (known || !f.key.matches(key))
                    return;
                known = true;
                if (seen[idx]) [[unlikely]]
                    throw cbor::decode_error(cbor::error_kind::duplicate_map_key,
                        fmt::format("field {} is present more than once", f.key.to_string()), std::optional<size_t> {}, f.key.to_string());
                seen[idx] = true;
                decode_field(obj, f, val, opts);
            });
            if (!known && !opts.allow_unknown_fields) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unknown_field, fmt::format("unknown field {}", key));
        }
        for_each_indexed(T::cbor_fields.items, [&](const auto &f, const size_t idx) {
            if (!seen[idx])
                decode_absent_field(obj, f);
        });
    }

    template<typename T>
    cbor::value elements_to_value(const T &obj)
    {
        constexpr size_t num_elems = T::cbor_elements.size();
        if constexpr (num_elems == 0) {
            return cbor::value::null();
        } else if constexpr (num_elems == 1) {
            return to_value(obj.*std::get<0>(T::cbor_elements.items));
        } else {
            cbor::array items {};
            items.reserve(num_elems);
            std::apply([&](const auto &...m) {
                (items.emplace_back(to_value(obj.*m)), ...);
            }, T::cbor_elements.items);
            return items;
        }
    }

    template<typename T>
    void elements_from_value(T &obj, const cbor::value &v, const cbor::decode_options &opts)
    {
        constexpr size_t num_elems = T::cbor_elements.size();
        if constexpr (num_elems == 0) {
            if (!v.is_null()) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type, fmt::format("expected null but got {}", v));
        } else if constexpr (num_elems == 1) {
            decode_into(obj.*std::get<0>(T::cbor_elements.items), v, opts);
        } else {
            const auto &items = v.array();
            if (items.size() != num_elems) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type,
                    fmt::format("expected an array of {} items but got {}", num_elems, items.size()));
            for_each_indexed(T::cbor_elements.items, [&](const auto &m, const size_t idx) {
                decode_item(obj.*m, items, idx, opts);
            });
        }
    }

    // the payload of a sum type alternative is its own mapping; alternatives without one carry no data
    template<typename A>
    cbor::value alternative_to_value(const A &alt)
    {
        if constexpr (has_fields_c<A> || has_elements_c<A>) {
            return to_value(alt);
        } else {
            static_assert(std::is_empty_v<A>, "a sum type alternative with data members needs cbor_fields or cbor_elements");
            return cbor::value::null();
        }
    }

    template<typename A>
    void alternative_from_value(A &alt, const cbor::value &v, const cbor::decode_options &opts)
    {
        if constexpr (has_fields_c<A> || has_elements_c<A>) {
            decode_into(alt, v, opts);
        } else {
            if (!v.is_null()) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type, fmt::format("expected null but got {}", v));
        }
    }

    template<typename... Alts>
    consteval bool has_unique_variant_keys()
    {
        const variant_key keys[] { Alts::cbor_variant..., variant_key { 0U } };
        for (size_t i = 0; i < sizeof...(Alts); ++i) {
            for (size_t j = i + 1; j < sizeof...(Alts); ++j) {
                if (keys[i] == keys[j])
                    return false;
            }
        }
        return true;
    }

    template<typename... Alts>
    cbor::value sum_to_value(const std::variant<Alts...> &sum)
    {
        static_assert(has_unique_variant_keys<Alts...>(), "sum type discriminants must be unique");
        return std::visit([](const auto &alt) {
            using A = std::decay_t<decltype(alt)>;
            cbor::map m {};
            m.emplace_back(A::cbor_variant.to_value(), alternative_to_value(alt));
            return cbor::value { std::move(m) };
        }, sum);
    }

    template<size_t I, typename... Alts>
    bool alternative_from_entry(std::variant<Alts...> &out, const cbor::value &key, const cbor::value &payload, const cbor::decode_options &opts)
    {
        if constexpr (I < sizeof...(Alts)) {
            using A = std::variant_alternative_t<I, std::variant<Alts...>>;
            if (!A::cbor_variant.matches(key))
                return alternative_from_entry<I + 1>(out, key, payload, opts);
            A alt {};
            nested(A::cbor_variant.to_string(), [&] {
                alternative_from_value(alt, payload, opts);
            });
            out.template emplace<I>(std::move(alt));
            return true;
        } else {
            return false;
        }
    }

    template<typename... Alts>
    void sum_from_value(std::variant<Alts...> &out, const cbor::value &v, const cbor::decode_options &opts)
    {
        static_assert(has_unique_variant_keys<Alts...>(), "sum type discriminants must be unique");
        const auto &m = v.map();
        if (m.size() != 1) [[unlikely]]
            throw cbor::decode_error(cbor::error_kind::unexpected_type,
                fmt::format("a sum type must be encoded as a single-entry map but got {} entries", m.size()));
        const auto &[key, payload] = m.front();
        if (!alternative_from_entry<0>(out, key, payload, opts)) [[unlikely]]
            throw cbor::decode_error(cbor::error_kind::unknown_field, fmt::format("unknown sum type discriminant {}", key));
    }

    template<typename T>
    cbor::value tuple_to_value(const T &tup)
    {
        cbor::array items {};
        items.reserve(std::tuple_size_v<T>);
        std::apply([&](const auto &...item) {
            (items.emplace_back(to_value(item)), ...);
        }, tup);
        return items;
    }

    template<typename T>
    void tuple_from_value(T &tup, const cbor::value &v, const cbor::decode_options &opts)
    {
        constexpr size_t arity = std::tuple_size_v<T>;
        const auto &items = v.array();
        if (items.size() != arity) [[unlikely]]
            throw cbor::decode_error(cbor::error_kind::unexpected_type,
                fmt::format("expected an array of {} items but got {}", arity, items.size()));
        std::apply([&](auto &...item) {
            size_t idx = 0;
            (decode_item(item, items, idx++, opts), ...);
        }, tup);
    }

    template<typename T>
    cbor::value to_value(const T &val)
    {
        if constexpr (std::is_same_v<T, cbor::value>) {
            return val;
        } else if constexpr (std::is_same_v<T, bool>) {
            return cbor::value::boolean(val);
        } else if constexpr (is_integer_v<T>) {
            if constexpr (std::is_signed_v<T>)
                return cbor::value::from_int(static_cast<int64_t>(val));
            else
                return cbor::value::from_uint(static_cast<uint64_t>(val));
        } else if constexpr (std::is_same_v<T, std::string>) {
            return cbor::value::from_text(val);
        } else if constexpr (is_bytes_v<T>) {
            return cbor::value::from_bytes(buffer { val.data(), val.size() });
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return cbor::value::null();
        } else if constexpr (has_fields_c<T>) {
            return record_to_value(val);
        } else if constexpr (has_elements_c<T>) {
            return elements_to_value(val);
        } else if constexpr (is_sum_type_v<T>) {
            return sum_to_value(val);
        } else if constexpr (is_specialization_v<T, std::optional>) {
            if (val)
                return to_value(*val);
            return cbor::value::null();
        } else if constexpr (is_specialization_v<T, std::vector>) {
            cbor::array items {};
            items.reserve(val.size());
            for (const auto &item: val)
                items.emplace_back(to_value(item));
            return items;
        } else if constexpr (is_native_map_v<T>) {
            cbor::map entries {};
            entries.reserve(val.size());
            for (const auto &[k, v]: val)
                entries.emplace_back(to_value(k), to_value(v));
            return entries;
        } else if constexpr (is_tuple_like_v<T>) {
            return tuple_to_value(val);
        } else if constexpr (bridge::serializable_c<T>) {
            return bridge::to_value(val);
        } else {
            static_assert(dependent_false_v<T>, "the type has no canonical CBOR mapping");
        }
    }

    template<typename T>
    void decode_into(T &out, const cbor::value &v, const cbor::decode_options &opts)
    {
        if constexpr (std::is_same_v<T, cbor::value>) {
            out = v;
        } else if constexpr (std::is_same_v<T, bool>) {
            out = v.as_bool();
        } else if constexpr (is_integer_v<T>) {
            out = decode_int<T>(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            out = v.text();
        } else if constexpr (std::is_same_v<T, uint8_vector>) {
            out = v.bytes();
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            const auto &bytes = v.bytes();
            out.assign(bytes.begin(), bytes.end());
        } else if constexpr (is_byte_array<T>::value) {
            const auto &bytes = v.bytes();
            if (bytes.size() != out.size()) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type,
                    fmt::format("expected a byte string of {} bytes but got {}", out.size(), bytes.size()));
            out = static_cast<buffer>(bytes);
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            if (!v.is_null()) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type, fmt::format("expected null but got {}", v));
        } else if constexpr (has_fields_c<T>) {
            record_from_value(out, v, opts);
        } else if constexpr (has_elements_c<T>) {
            elements_from_value(out, v, opts);
        } else if constexpr (is_sum_type_v<T>) {
            sum_from_value(out, v, opts);
        } else if constexpr (is_specialization_v<T, std::optional>) {
            if (v.is_null()) {
                out.reset();
            } else {
                typename T::value_type item {};
                decode_into(item, v, opts);
                out = std::move(item);
            }
        } else if constexpr (is_specialization_v<T, std::vector>) {
            const auto &items = v.array();
            T res {};
            res.reserve(items.size());
            for (size_t i = 0; i < items.size(); ++i) {
                typename T::value_type item {};
                decode_item(item, items, i, opts);
                res.emplace_back(std::move(item));
            }
            out = std::move(res);
        } else if constexpr (is_native_map_v<T>) {
            T res {};
            for (const auto &[k, val]: v.map()) {
                nested(fmt::format("[{}]", k), [&] {
                    typename T::key_type key {};
                    decode_into(key, k, opts);
                    typename T::mapped_type item {};
                    decode_into(item, val, opts);
                    if (!res.emplace(std::move(key), std::move(item)).second) [[unlikely]]
                        throw cbor::decode_error(cbor::error_kind::duplicate_map_key, "two keys decode to the same native key");
                });
            }
            out = std::move(res);
        } else if constexpr (is_tuple_like_v<T>) {
            tuple_from_value(out, v, opts);
        } else if constexpr (bridge::serializable_c<T>) {
            bridge::decode_into(out, v, opts);
        } else {
            static_assert(dependent_false_v<T>, "the type has no canonical CBOR mapping");
        }
    }

    template<typename T>
    T from_value(const cbor::value &v, const cbor::decode_options &opts={})
    {
        static_assert(std::is_default_constructible_v<T>, "decoded types must be default constructible");
        T res {};
        decode_into(res, v, opts);
        return res;
    }

    template<typename T>
    uint8_vector to_cbor(const T &val)
    {
        return cbor::encode(to_value(val));
    }

    // the input must be exactly one canonical item
    template<typename T>
    T from_cbor(const buffer data, const cbor::decode_options &opts={})
    {
        return from_value<T>(cbor::decode_exact(data, opts), opts);
    }
}

#endif // !CANON_CBOR_CODEC_CODEC_HPP
