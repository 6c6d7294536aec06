/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <canon/common/file.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;

suite common_file_suite = [] {
    "common::file"_test = [] {
        const auto tmp_dir = std::filesystem::temp_directory_path();
        "write and read"_test = [&] {
            const auto path = (tmp_dir / "canon-file-test.bin").string();
            const auto data = uint8_vector::from_hex("A16161F5");
            file::write(path, data);
            test_same(file::read(path), data);
            std::filesystem::remove(path);
        };
        "empty file"_test = [&] {
            const auto path = (tmp_dir / "canon-file-test-empty.bin").string();
            file::write(path, uint8_vector {});
            test_same(file::read(path).size(), 0);
            std::filesystem::remove(path);
        };
        "read_hex"_test = [&] {
            const auto path = (tmp_dir / "canon-file-test.hex").string();
            file::write(path, std::string_view { "a1 61 61\n f5\n" });
            test_same(file::read_hex(path), uint8_vector::from_hex("A16161F5"));
            std::filesystem::remove(path);
        };
        "missing file"_test = [&] {
            expect(throws([&] { file::read((tmp_dir / "canon-file-test-missing.bin").string()); }));
        };
    };
};
