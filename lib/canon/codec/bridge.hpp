/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CODEC_BRIDGE_HPP
#define CANON_CBOR_CODEC_BRIDGE_HPP

#include <system_error>
#include <canon/cbor/decoder.hpp>
#include <canon/cbor/value.hpp>
#include <canon/codec/descriptor.hpp>
#include <canon/codec/fwd.hpp>

/*
 * Types written for zpp_bits declare their members once:
 *
 *   static constexpr auto serialize(auto &archive, auto &self)
 *   {
 *       return archive(self.a, self.b);
 *   }
 *
 * The archives below implement the same call contract in terms of the canonical codec,
 * so such a type is mapped to a fixed-arity array of its archived members without a separate field list.
 */

namespace canon_cbor::codec::bridge {
    struct detect_archive {
        template<typename... Args>
        constexpr std::errc operator()(Args &&...) const noexcept
        {
            return {};
        }
    };

    template<typename T>
    concept serializable_c = !has_fields_c<T> && !has_elements_c<T>
        && requires(T &self, detect_archive &archive) { T::serialize(archive, self); };

    struct out_archive {
        explicit out_archive(cbor::array &items): _items { items }
        {
        }

        template<typename... Args>
        std::errc operator()(const Args &...args)
        {
            (_items.emplace_back(codec::to_value(args)), ...);
            return {};
        }
    private:
        cbor::array &_items;
    };

    struct in_archive {
        in_archive(const cbor::array &items, const cbor::decode_options &opts): _items { items }, _opts { opts }
        {
        }

        template<typename... Args>
        std::errc operator()(Args &...args)
        {
            (_read(args), ...);
            return {};
        }

        size_t consumed() const noexcept
        {
            return _next;
        }
    private:
        const cbor::array &_items;
        const cbor::decode_options &_opts;
        size_t _next = 0;

        template<typename M>
        void _read(M &member)
        {
            if (_next >= _items.size()) [[unlikely]]
                throw cbor::decode_error(cbor::error_kind::unexpected_type,
                    fmt::format("expected more than {} array items", _items.size()));
            const auto idx = _next++;
            try {
                codec::decode_into(member, _items[idx], _opts);
            } catch (const cbor::decode_error &ex) {
                throw ex.nested(fmt::format("[{}]", idx));
            }
        }
    };

    template<serializable_c T>
    cbor::value to_value(const T &self)
    {
        cbor::array items {};
        out_archive archive { items };
        T::serialize(archive, self);
        return items;
    }

    template<serializable_c T>
    void decode_into(T &self, const cbor::value &v, const cbor::decode_options &opts)
    {
        const auto &items = v.array();
        in_archive archive { items, opts };
        T::serialize(archive, self);
        if (archive.consumed() != items.size()) [[unlikely]]
            throw cbor::decode_error(cbor::error_kind::unexpected_type,
                fmt::format("expected an array of {} items but got {}", archive.consumed(), items.size()));
    }
}

#endif // !CANON_CBOR_CODEC_BRIDGE_HPP
