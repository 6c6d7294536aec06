/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <iterator>
#include <limits>
#include <canon/cbor/value.hpp>

namespace canon_cbor::cbor {
    const value &array::at(const size_t idx, const std::source_location &loc) const
    {
        if (idx >= size()) [[unlikely]]
            throw decode_error(error_kind::unexpected_type, fmt::format("invalid element index {} in the array of size {} in file {} line {}",
                idx, size(), loc.file_name(), loc.line()));
        return operator[](idx);
    }

    const value *map::find(const value &key) const
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    bool map::operator==(const map &o) const
    {
        if (size() != o.size())
            return false;
        for (const auto &[k, v]: *this) {
            const auto *o_v = o.find(k);
            if (!o_v || !(*o_v == v))
                return false;
        }
        return true;
    }

    value::value(const special_val sv): _type { major_type::simple }, _storage { sv }
    {
        switch (sv) {
            case special_val::s_false:
            case special_val::s_true:
            case special_val::s_null:
            case special_val::s_undefined:
                break;
            default:
                throw error(fmt::format("unsupported simple value: {}", sv));
        }
    }

    bool value::as_bool() const
    {
        switch (special()) {
            case special_val::s_true: return true;
            case special_val::s_false: return false;
            default: throw decode_error(error_kind::unexpected_type, fmt::format("expected a boolean but got {}", special()));
        }
    }

    bool value::operator==(const value &o) const
    {
        if (_type != o._type)
            return false;
        switch (_type) {
            case major_type::uint:
            case major_type::nint:
                return std::get<uint64_t>(_storage) == std::get<uint64_t>(o._storage);
            case major_type::bytes:
                return std::get<uint8_vector>(_storage) == std::get<uint8_vector>(o._storage);
            case major_type::text:
                return std::get<std::string>(_storage) == std::get<std::string>(o._storage);
            case major_type::array: {
                const auto &a = std::get<cbor::array>(_storage);
                const auto &b = std::get<cbor::array>(o._storage);
                return std::equal(a.begin(), a.end(), b.begin(), b.end());
            }
            case major_type::map:
                return std::get<cbor::map>(_storage) == std::get<cbor::map>(o._storage);
            case major_type::tag:
                return std::get<cbor::tag>(_storage) == std::get<cbor::tag>(o._storage);
            case major_type::simple:
                return std::get<special_val>(_storage) == std::get<special_val>(o._storage);
            default:
                throw error(fmt::format("unsupported major type: {}", _type));
        }
    }

    static void stringify_to(std::back_insert_iterator<std::string> out, const value &v)
    {
        switch (v.type()) {
            case major_type::uint:
                fmt::format_to(out, "I {}", v.uint());
                break;
            case major_type::nint:
                if (v.nint_raw() == std::numeric_limits<uint64_t>::max())
                    fmt::format_to(out, "I -18446744073709551616");
                else
                    fmt::format_to(out, "I -{}", v.nint_raw() + 1);
                break;
            case major_type::bytes: {
                const auto &b = v.bytes();
                fmt::format_to(out, "B #{}", b);
                if (!b.empty() && is_ascii(b))
                    fmt::format_to(out, " ('{}')", b.str());
                break;
            }
            case major_type::text:
                fmt::format_to(out, "T '{}'", v.text());
                break;
            case major_type::array: {
                fmt::format_to(out, "[");
                const auto &a = v.array();
                for (auto it = a.begin(); it != a.end(); ++it) {
                    if (it != a.begin())
                        fmt::format_to(out, ", ");
                    stringify_to(out, *it);
                }
                fmt::format_to(out, "]");
                break;
            }
            case major_type::map: {
                fmt::format_to(out, "{{");
                const auto &m = v.map();
                for (auto it = m.begin(); it != m.end(); ++it) {
                    if (it != m.begin())
                        fmt::format_to(out, ", ");
                    stringify_to(out, it->first);
                    fmt::format_to(out, ": ");
                    stringify_to(out, it->second);
                }
                fmt::format_to(out, "}}");
                break;
            }
            case major_type::tag:
                fmt::format_to(out, "TAG {} ", v.tag().id());
                stringify_to(out, v.tag().val());
                break;
            case major_type::simple:
                fmt::format_to(out, "{}", v.special());
                break;
            default:
                throw error(fmt::format("unsupported major type: {}", v.type()));
        }
    }

    std::string stringify(const value &v)
    {
        std::string res {};
        stringify_to(std::back_inserter(res), v);
        return res;
    }
}
