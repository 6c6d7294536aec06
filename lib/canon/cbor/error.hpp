/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_ERROR_HPP
#define CANON_CBOR_CBOR_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <canon/common/error.hpp>
#include <canon/common/format.hpp>

namespace canon_cbor::cbor {
    enum class error_kind: uint8_t {
        unexpected_type,
        non_canonical_encoding,
        duplicate_map_key,
        unknown_field,
        missing_required_field,
        integer_overflow,
        depth_exceeded,
        trailing_bytes,
        incomplete,
        malformed,
        unsupported_item,
        custom
    };
}

namespace fmt {
    template<>
    struct formatter<canon_cbor::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using canon_cbor::cbor::error_kind;
            switch (v) {
                case error_kind::unexpected_type: return fmt::format_to(ctx.out(), "unexpected_type");
                case error_kind::non_canonical_encoding: return fmt::format_to(ctx.out(), "non_canonical_encoding");
                case error_kind::duplicate_map_key: return fmt::format_to(ctx.out(), "duplicate_map_key");
                case error_kind::unknown_field: return fmt::format_to(ctx.out(), "unknown_field");
                case error_kind::missing_required_field: return fmt::format_to(ctx.out(), "missing_required_field");
                case error_kind::integer_overflow: return fmt::format_to(ctx.out(), "integer_overflow");
                case error_kind::depth_exceeded: return fmt::format_to(ctx.out(), "depth_exceeded");
                case error_kind::trailing_bytes: return fmt::format_to(ctx.out(), "trailing_bytes");
                case error_kind::incomplete: return fmt::format_to(ctx.out(), "incomplete");
                case error_kind::malformed: return fmt::format_to(ctx.out(), "malformed");
                case error_kind::unsupported_item: return fmt::format_to(ctx.out(), "unsupported_item");
                case error_kind::custom: return fmt::format_to(ctx.out(), "custom");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace canon_cbor::cbor {
    // Raised by the decoder (with the byte offset of the offending item) and by the mapping layer
    // (with the path of the offending field). A failed call leaves no partially constructed output.
    struct decode_error: error {
        decode_error(const error_kind kind, const std::string_view detail,
                const std::optional<size_t> offset={}, const std::string_view path={}):
            error { _make_msg(kind, detail, offset, path) },
            _kind { kind }, _detail { detail }, _offset { offset }, _path { path }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        const std::string &detail() const noexcept
        {
            return _detail;
        }

        std::optional<size_t> offset() const noexcept
        {
            return _offset;
        }

        const std::string &path() const noexcept
        {
            return _path;
        }

        // a copy of the error relocated under the given outer path segment: "field" or "[idx]"
        decode_error nested(const std::string_view segment) const
        {
            std::string new_path { segment };
            if (!_path.empty()) {
                if (_path.front() != '[')
                    new_path += '.';
                new_path += _path;
            }
            return { _kind, _detail, _offset, new_path };
        }
    private:
        error_kind _kind;
        std::string _detail;
        std::optional<size_t> _offset;
        std::string _path;

        static std::string _make_msg(const error_kind kind, const std::string_view detail,
            const std::optional<size_t> offset, const std::string_view path)
        {
            std::string msg = fmt::format("{}: {}", kind, detail);
            if (offset)
                msg += fmt::format(" at offset {}", *offset);
            if (!path.empty())
                msg += fmt::format(" at {}", path);
            return msg;
        }
    };

    // A value violating the canonical invariants was handed to the encoder: a programming error.
    struct invariant_error: error {
        using error::error;
    };
}

#endif // !CANON_CBOR_CBOR_ERROR_HPP
