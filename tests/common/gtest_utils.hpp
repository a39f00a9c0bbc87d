// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "exception.hpp"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})

namespace luhn::test {

inline std::string codepoint_to_str(char32_t c)
{
    return fmt::format("U+{:04X}", static_cast<uint32_t>(c));
}

// Succeeds if fn throws a checksum_error with the given code and character
template <typename Fn>
::testing::AssertionResult throws_checksum_error(
    Fn &&fn, error_code expected_code, char32_t expected_character = 0)
{
    try {
        fn();
    } catch (const checksum_error &e) {
        if (e.code() != expected_code) {
            return ::testing::AssertionFailure()
                   << "expected " << error_code_to_str(expected_code) << ", got "
                   << error_code_to_str(e.code()) << ": " << e.what();
        }

        if (e.character() != expected_character) {
            return ::testing::AssertionFailure()
                   << "expected character " << codepoint_to_str(expected_character)
                   << ", got " << codepoint_to_str(e.character()) << ": " << e.what();
        }

        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << "no exception thrown";
}

} // namespace luhn::test

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define EXPECT_CHECKSUM_ERROR(stmt, ...)                                                           \
    EXPECT_TRUE(luhn::test::throws_checksum_error([&]() { (void)(stmt); }, __VA_ARGS__))
// NOLINTEND(cppcoreguidelines-macro-usage)
