/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <canon/cli.hpp>
#include <canon/common/file.hpp>

namespace canon_cbor::cli {
    static std::optional<uint64_t> parse_uint(const std::string_view text)
    {
        uint64_t val = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
        if (ec != std::errc {} || ptr != text.data() + text.size() || text.empty())
            return {};
        return val;
    }

    static std::optional<std::string> validate_uint(const std::optional<std::string> &val)
    {
        if (!val || !parse_uint(*val))
            return "must be a non-negative integer";
        return {};
    }

    static std::optional<std::string> validate_uint_list(const std::optional<std::string> &val)
    {
        if (!val)
            return "must be a comma-separated list of non-negative integers";
        std::string_view rest { *val };
        while (!rest.empty()) {
            const auto sep_pos = rest.find(',');
            if (!parse_uint(rest.substr(0, sep_pos)))
                return fmt::format("'{}' is not a non-negative integer", rest.substr(0, sep_pos));
            rest = sep_pos == rest.npos ? std::string_view {} : rest.substr(sep_pos + 1);
        }
        return {};
    }

    void add_input_options(config &cmd)
    {
        cmd.opts.try_emplace("hex", "the input file contains hexadecimal text instead of raw bytes");
        cmd.opts.try_emplace("max-depth", "the maximum nesting level of the input",
            fmt::format("{}", cbor::default_max_depth), validate_uint);
        cmd.opts.try_emplace("tags", "accept only the listed tags", std::optional<std::string> {}, validate_uint_list);
    }

    uint8_vector read_input(const arguments &args, const options &opts)
    {
        const auto &path = args.at(0);
        if (opts.contains("hex"))
            return file::read_hex(path);
        return file::read(path);
    }

    cbor::decode_options make_decode_options(const options &opts)
    {
        cbor::decode_options dec_opts {};
        if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
            dec_opts.max_depth = static_cast<size_t>(parse_uint(*it->second).value());
        if (const auto it = opts.find("tags"); it != opts.end() && it->second) {
            flat_set<uint64_t> tags {};
            std::string_view rest { *it->second };
            while (!rest.empty()) {
                const auto sep_pos = rest.find(',');
                tags.emplace(parse_uint(rest.substr(0, sep_pos)).value());
                rest = sep_pos == rest.npos ? std::string_view {} : rest.substr(sep_pos + 1);
            }
            dec_opts.allowed_tags = std::move(tags);
        }
        return dec_opts;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::ios_base::sync_with_stdio(false);
        map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {} {}\n", name, meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        int exit_code = 1;
        const auto ex = logger::run_log_errors([&] {
            const auto &meta = cmd_it->second;
            const auto pr = meta.cmd->parse(meta.cfg, args);
            exit_code = meta.cmd->run(pr.args, pr.opts);
        });
        return ex ? 1 : exit_code;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
