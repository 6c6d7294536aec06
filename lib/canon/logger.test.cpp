/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canon/logger.hpp>
#include <canon/common/test.hpp>

using namespace canon_cbor;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            expect(true);
        };
        "last_error"_test = [] {
            logger::reset_last_error();
            expect(!logger::last_error());
            logger::error("OK - {}", "error");
            const auto last = logger::last_error();
            expect(static_cast<bool>(last));
            if (last)
                test_same(*last, std::string { "OK - error" });
            logger::reset_last_error();
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
            bool cleaned_up = false;
            const auto ex3 = logger::run_log_errors([] { throw std::runtime_error("Something bad!"); }, [&] { cleaned_up = true; });
            expect(static_cast<bool>(ex3));
            expect(cleaned_up);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
