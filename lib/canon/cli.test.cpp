/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <canon/cli.hpp>
#include <canon/common/file.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;

namespace {
    struct echo_cmd: cli::command {
        mutable cli::arguments last_args {};

        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "a command for tests";
            cmd.args.expect({ "<path>", "[<extra>]" });
            cli::add_input_options(cmd);
        }

        int run(const cli::arguments &args, const cli::options &) const override
        {
            last_args = args;
            return args.size() == 2 ? 3 : 0;
        }
    };

    struct failing_cmd: cli::command {
        void configure(cli::config &cmd) const override
        {
            cmd.name = "fail";
            cmd.desc = "always throws";
        }

        int run(const cli::arguments &, const cli::options &) const override
        {
            throw canon_cbor::error("the command has failed");
        }
    };
}

suite cli_suite = [] {
    "cli"_test = [] {
        const auto echo = std::make_shared<echo_cmd>();
        cli::config cfg {};
        echo->configure(cfg);
        "argument_config"_test = [&] {
            test_same(cfg.args.min, std::optional<size_t> { 1 });
            test_same(cfg.args.max, std::optional<size_t> { 2 });
            cli::argument_config many {};
            many.expect({ "<a>", "[<b>...]" });
            test_same(many.min, std::optional<size_t> { 1 });
            test_same(many.max, std::optional<size_t> { std::numeric_limits<size_t>::max() });
        };
        "parse"_test = [&] {
            const auto pr = echo->parse(cfg, { "in.cbor", "--hex", "--tags=24,258" });
            test_same(pr.args.size(), 1);
            test_same(pr.args.at(0), std::string { "in.cbor" });
            expect(pr.opts.contains("hex"));
            expect(!pr.opts.at("hex"));
            test_same(pr.opts.at("tags"), std::optional<std::string> { "24,258" });
            // defaults are filled in
            test_same(pr.opts.at("max-depth"), std::optional<std::string> { "128" });
        };
        "parse errors"_test = [&] {
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--unknown" }); }));
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--hex", "--hex" }); }));
            expect(throws([&] { echo->parse(cfg, {}); }));
            expect(throws([&] { echo->parse(cfg, { "a", "b", "c" }); }));
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--max-depth=deep" }); }));
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--max-depth" }); }));
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--tags=1,,2" }); }));
            expect(throws([&] { echo->parse(cfg, { "in.cbor", "--tags=1,x" }); }));
        };
        "make_decode_options"_test = [&] {
            const auto defaults = cli::make_decode_options(echo->parse(cfg, { "in.cbor" }).opts);
            test_same(defaults.max_depth, cbor::default_max_depth);
            expect(!defaults.allowed_tags);
            expect(!defaults.allow_unknown_fields);
            const auto custom = cli::make_decode_options(echo->parse(cfg, { "in.cbor", "--max-depth=4", "--tags=258,24" }).opts);
            test_same(custom.max_depth, 4);
            expect(static_cast<bool>(custom.allowed_tags));
            if (custom.allowed_tags) {
                test_same(custom.allowed_tags->size(), 2);
                expect(custom.allowed_tags->count(24) == 1);
                expect(custom.allowed_tags->count(258) == 1);
            }
        };
        "read_input"_test = [&] {
            const auto tmp_dir = std::filesystem::temp_directory_path();
            const auto bin_path = (tmp_dir / "canon-cli-test.cbor").string();
            const auto hex_path = (tmp_dir / "canon-cli-test.hex").string();
            file::write(bin_path, uint8_vector::from_hex("820102"));
            file::write(hex_path, std::string_view { "82 01 02\n" });
            test_same(cli::read_input({ bin_path }, echo->parse(cfg, { bin_path }).opts), uint8_vector::from_hex("820102"));
            test_same(cli::read_input({ hex_path }, echo->parse(cfg, { hex_path, "--hex" }).opts), uint8_vector::from_hex("820102"));
            std::filesystem::remove(bin_path);
            std::filesystem::remove(hex_path);
        };
        "run"_test = [&] {
            const cli::command::command_list commands { echo, std::make_shared<failing_cmd>() };
            {
                const char *argv[] { "canon", "echo", "in.cbor" };
                test_same(cli::run(3, argv, commands), 0);
                test_same(echo->last_args.size(), 1);
            }
            {
                const char *argv[] { "canon", "echo", "in.cbor", "extra" };
                test_same(cli::run(4, argv, commands), 3);
            }
            {
                const char *argv[] { "canon", "echo" };
                test_same(cli::run(2, argv, commands), 1);
            }
            {
                const char *argv[] { "canon", "fail" };
                test_same(cli::run(2, argv, commands), 1);
            }
            {
                const char *argv[] { "canon", "missing" };
                test_same(cli::run(2, argv, commands), 1);
            }
            {
                const char *argv[] { "canon" };
                test_same(cli::run(1, argv, commands), 1);
            }
            const cli::command::command_list duplicates { echo, echo };
            const char *argv[] { "canon", "echo", "in.cbor" };
            expect(throws([&] { cli::run(3, argv, duplicates); }));
        };
    };
};
