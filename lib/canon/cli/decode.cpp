/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/cli.hpp>
#include <canon/cbor/decoder.hpp>

namespace canon_cbor::cli::decode {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "decode";
            cmd.desc = "print the diagnostic notation of a canonical CBOR item";
            cmd.args.expect({ "<path>" });
            add_input_options(cmd);
            cmd.opts.try_emplace("stream", "the input is a sequence of items");
        }

        int run(const arguments &args, const options &opts) const override
        {
            const auto data = read_input(args, opts);
            const auto dec_opts = make_decode_options(opts);
            if (opts.contains("stream")) {
                const auto items = cbor::decode_all(data, dec_opts);
                for (size_t i = 0; i < items.size(); ++i)
                    std::cout << fmt::format("ITEM {}: {}\n", i, items[i]);
                logger::info("decoded {} items from {} bytes", items.size(), data.size());
            } else {
                std::cout << fmt::format("{}\n", cbor::decode_exact(data, dec_opts));
            }
            return 0;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
