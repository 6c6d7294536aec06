/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_CLI_HPP
#define CANON_CBOR_CLI_HPP

#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <canon/container.hpp>
#include <canon/logger.hpp>
#include <canon/cbor/decoder.hpp>

namespace canon_cbor::cli {
    using arguments = vector<std::string>;
    using options = map<std::string, std::optional<std::string>>;

    using option_validator = std::function<std::optional<std::string>(const std::optional<std::string> &)>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
        std::optional<option_validator> validator {};
    };
    using option_config_map = map<std::string, option_config>;

    struct argument_config {
        std::optional<size_t> min {};
        std::optional<size_t> max {};
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            size_t req = 0;
            size_t opt = 0;
            for (const auto &a: args) {
                if (a.at(0) == '[') {
                    if (a.ends_with("...]"))
                        opt = std::numeric_limits<size_t>::max();
                    if (opt < std::numeric_limits<size_t>::max())
                        ++opt;
                } else {
                    ++req;
                }
            }
            min = req;
            max = req;
            if (opt == std::numeric_limits<size_t>::max())
                *max = opt;
            else
                *max += opt;
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &name: args.names)
                arg_info += fmt::format(" {}", name);
            const std::string opt_info { opts.empty() ? "" : "[options]" };
            return fmt::format("{}{} - {}", opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        // returns the process exit code
        virtual int run(const arguments &args, const options &opts) const =0;

        parse_result parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (const auto &arg: args) {
                if (arg.substr(0, 2) == "--") {
                    std::string name = arg.substr(2);
                    std::optional<std::string> val {};
                    if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                        val = arg.substr(eq_pos + 1);
                        name = arg.substr(2, eq_pos - 2);
                    }
                    if (!cfg.opts.contains(name))
                        throw error(fmt::format("unknown option '--{}'", name));
                    const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val));
                    if (!opt_created)
                        throw error(fmt::format("duplicate option specification '{}'", arg));
                } else {
                    pr.args.emplace_back(arg);
                }
            }
            for (const auto &[name, opt_cfg]: cfg.opts) {
                if (opt_cfg.default_value && !pr.opts.contains(name))
                    pr.opts.emplace(name, *opt_cfg.default_value);
                if (const auto val_it = pr.opts.find(name); opt_cfg.validator && val_it != pr.opts.end()) {
                    if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                        throw error(fmt::format("value {} is invalid for '--{}': {}", val_it->second, name, *val_err));
                }
            }
            if (cfg.args.min && pr.args.size() < *cfg.args.min)
                _throw_usage(cfg);
            if (cfg.args.max && pr.args.size() > *cfg.args.max)
                _throw_usage(cfg);
            return pr;
        }
    protected:
        [[noreturn]] static void _throw_usage(const config &cmd)
        {
            std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
            if (!cmd.opts.empty()) {
                usage += fmt::format("\n{} supports the following options:", cmd.name);
                for (const auto &[name, opt_cfg]: cmd.opts) {
                    if (opt_cfg.default_value)
                        usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt_cfg.default_value, opt_cfg.desc);
                    else
                        usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
                }
            }
            throw error(usage);
        }
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    // the options shared by the commands that parse CBOR input
    extern void add_input_options(config &cmd);
    extern uint8_vector read_input(const arguments &args, const options &opts);
    extern cbor::decode_options make_decode_options(const options &opts);

    extern int run(const int argc, const char **argv, const command::command_list &command_list);
    extern int run(const int argc, const char **argv);
}

#endif // !CANON_CBOR_CLI_HPP
