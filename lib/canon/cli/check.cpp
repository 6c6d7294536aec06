/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/cli.hpp>
#include <canon/cbor/canonical.hpp>
#include <canon/cbor/decoder.hpp>

namespace canon_cbor::cli::check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check";
            cmd.desc = "succeed only if the file holds exactly one item in the canonical encoding";
            cmd.args.expect({ "<path>" });
            add_input_options(cmd);
        }

        int run(const arguments &args, const options &opts) const override
        {
            const auto data = read_input(args, opts);
            try {
                const auto val = cbor::decode_exact(data, make_decode_options(opts));
                // the decoder accepts only canonical input so re-encoding must reproduce it
                if (cbor::encode(val) != data) [[unlikely]]
                    throw error(fmt::format("re-encoding {} did not reproduce the input", args.at(0)));
            } catch (const cbor::decode_error &ex) {
                std::cout << fmt::format("{}: not canonical: {}\n", args.at(0), ex.what());
                return 1;
            }
            std::cout << fmt::format("{}: canonical\n", args.at(0));
            return 0;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
