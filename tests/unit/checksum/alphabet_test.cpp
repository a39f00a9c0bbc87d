// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include "checksum/alphabet.hpp"

#include "common/gtest_utils.hpp"

using namespace luhn;

namespace {

TEST(TestAlphabet, Empty) { EXPECT_CHECKSUM_ERROR(alphabet{U""}, error_code::empty_alphabet); }

TEST(TestAlphabet, DuplicateCharacter)
{
    EXPECT_CHECKSUM_ERROR(alphabet{U"abcdea"}, error_code::duplicate_character, U'a');
    EXPECT_CHECKSUM_ERROR(alphabet{U"aa"}, error_code::duplicate_character, U'a');

    // First repeated character in declaration order
    EXPECT_CHECKSUM_ERROR(alphabet{U"abba"}, error_code::duplicate_character, U'b');
    EXPECT_CHECKSUM_ERROR(alphabet{U"zyxzyx"}, error_code::duplicate_character, U'z');
}

TEST(TestAlphabet, CodepointsFollowSortedOrder)
{
    alphabet alpha{U"fedcba"};
    ASSERT_EQ(alpha.size(), 6);

    EXPECT_EQ(alpha.codepoint_of(U'a'), 0);
    EXPECT_EQ(alpha.codepoint_of(U'c'), 2);
    EXPECT_EQ(alpha.codepoint_of(U'f'), 5);

    EXPECT_EQ(alpha.character_of(0), U'a');
    EXPECT_EQ(alpha.character_of(5), U'f');
}

TEST(TestAlphabet, CodepointRoundTrip)
{
    alphabet alpha{U"0123456789ΑΒΓΔ😀"};
    ASSERT_EQ(alpha.size(), 15);

    for (std::size_t i = 0; i < alpha.size(); ++i) {
        EXPECT_EQ(alpha.codepoint_of(alpha.character_of(i)), i);
    }
    EXPECT_EQ(alpha.character_of(14), U'😀');
}

TEST(TestAlphabet, InvalidCharacter)
{
    alphabet alpha{U"abc"};
    EXPECT_FALSE(alpha.contains(U'd'));
    EXPECT_TRUE(alpha.contains(U'b'));
    EXPECT_CHECKSUM_ERROR(alpha.codepoint_of(U'd'), error_code::invalid_character, U'd');
    EXPECT_CHECKSUM_ERROR(alpha.codepoint_of(U'A'), error_code::invalid_character, U'A');
}

} // namespace
