/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_COMMON_FILE_HPP
#define CANON_CBOR_COMMON_FILE_HPP

#include <string>
#include "bytes.hpp"

namespace canon_cbor::file {
    extern void read(const std::string &path, uint8_vector &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // a text file with hexadecimal digits; whitespace is ignored
    extern uint8_vector read_hex(const std::string &path);

    extern void write(const std::string &path, const buffer data);
}

#endif // !CANON_CBOR_COMMON_FILE_HPP
