/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CBOR_DECODER_HPP
#define CANON_CBOR_CBOR_DECODER_HPP

#include <optional>
#include <canon/common/bytes.hpp>
#include <canon/container.hpp>
#include <canon/cbor/error.hpp>
#include <canon/cbor/value.hpp>

namespace canon_cbor::cbor {
    static constexpr size_t default_max_depth = 128;

    struct decode_options {
        // the top-level item is at depth 0, the items of a container at depth N are at depth N + 1
        size_t max_depth = default_max_depth;
        // when set, map keys not known to a record mapping are skipped instead of being rejected
        bool allow_unknown_fields = false;
        // when set, only the listed tags are accepted
        std::optional<flat_set<uint64_t>> allowed_tags {};
    };

    struct decoded {
        value val;
        size_t size;
    };

    // Parses exactly one item from the beginning of data. Bytes after it are not inspected.
    extern decoded decode(buffer data, const decode_options &opts={});
    // Parses exactly one item and fails with trailing_bytes unless it covers the whole of data.
    extern value decode_exact(buffer data, const decode_options &opts={});
    // Parses a concatenation of items.
    extern vector<value> decode_all(buffer data, const decode_options &opts={});
}

#endif // !CANON_CBOR_CBOR_DECODER_HPP
