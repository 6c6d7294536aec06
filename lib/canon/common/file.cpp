/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cctype>
#include <filesystem>
#include <fstream>
#include "file.hpp"

namespace canon_cbor::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to get the size of {}: {}", path, ec.message()));
        std::ifstream is { path, std::ios::binary };
        if (!is) [[unlikely]]
            throw error(fmt::format("failed to open {} for reading", path));
        buf.resize(sz);
        if (sz > 0 && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(sz))) [[unlikely]]
            throw error(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    uint8_vector read_hex(const std::string &path)
    {
        const auto raw = read(path);
        std::string hex {};
        hex.reserve(raw.size());
        for (const auto c: raw) {
            if (!std::isspace(c))
                hex.push_back(static_cast<char>(c));
        }
        return uint8_vector::from_hex(hex);
    }

    void write(const std::string &path, const buffer data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os) [[unlikely]]
            throw error(fmt::format("failed to open {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()))) [[unlikely]]
            throw error(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
