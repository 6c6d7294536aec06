/* This file is part of Canon CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANON_CBOR_COMMON_TEST_HPP
#define CANON_CBOR_COMMON_TEST_HPP

#include <iostream>
#include <optional>
#include <source_location>
#include <type_traits>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace canon_cbor {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, typename Y>
        requires (!std::is_same_v<X, Y>) && std::is_constructible_v<X, Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // E must expose kind(); exceptions of other types propagate and fail the test
    template<typename E, typename F, typename K>
    bool expect_throws_kind(const F &f, const K kind, const std::source_location &loc=std::source_location::current())
    {
        std::optional<K> got {};
        try {
            f();
        } catch (const E &ex) {
            got = ex.kind();
        }
        expect(got.has_value(), loc) << fmt::format("no exception of the expected type has been thrown, expected kind: {}", kind);
        if (!got)
            return false;
        const auto res = *got == kind;
        expect(res, loc) << fmt::format("expected error kind {} but got {}", kind, *got);
        return res;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<canon_cbor::test_printer>> {};

#endif // !CANON_CBOR_COMMON_TEST_HPP
