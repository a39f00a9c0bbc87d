// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include "checksum/luhn_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace luhn;

namespace {

TEST(TestLuhnChecksum, Generate)
{
    // Base 6
    EXPECT_EQ(luhn_checksum{U"abcdef"}.generate(U"abcdef"), U'e');

    // Base 10
    EXPECT_EQ(luhn_checksum{U"0123456789"}.generate(U"7992739871"), U'3');
    EXPECT_EQ(luhn_checksum{U"0123456789"}.generate(U"123"), U'2');

    // Base 16
    EXPECT_EQ(luhn_checksum{U"0123456789abcdef"}.generate(U"1a2b3c"), U'5');
    EXPECT_EQ(luhn_checksum{U"0123456789abcdef"}.generate(U"deadbeef"), U'c');

    // Base 36
    EXPECT_EQ(luhn_checksum{U"0123456789abcdefghijklmnopqrstuvwxyz"}.generate(U"hello"), U'b');
}

TEST(TestLuhnChecksum, GenerateUTF8)
{
    EXPECT_EQ(luhn_checksum{"abcdef"}.generate("abcdef"), U'e');
    EXPECT_EQ(luhn_checksum{"0123456789"}.generate("7992739871"), U'3');

    luhn_checksum greek{"αβγδε"};
    EXPECT_EQ(greek.size(), 5);
    EXPECT_EQ(greek.generate("αβγ"), U'β');
    EXPECT_EQ(greek.generate("εδ"), U'ε');
}

TEST(TestLuhnChecksum, SingleCharacterAlphabet)
{
    luhn_checksum engine{U"x"};
    EXPECT_EQ(engine.generate(U"x"), U'x');
    EXPECT_EQ(engine.generate(U"xxxx"), U'x');
    EXPECT_TRUE(engine.validate(U"xx"));
}

TEST(TestLuhnChecksum, DeclarationOrderIsIrrelevant)
{
    luhn_checksum sorted{U"abcdef"};
    luhn_checksum reversed{U"fedcba"};
    luhn_checksum shuffled{U"dafbec"};

    for (const auto *input : {U"abcdef", U"a", U"ffff", U"cafe", U"bead", U"decade"}) {
        EXPECT_EQ(sorted.generate(input), reversed.generate(input));
        EXPECT_EQ(sorted.generate(input), shuffled.generate(input));
    }
}

TEST(TestLuhnChecksum, InvalidCharacter)
{
    luhn_checksum engine{U"abcdef"};
    EXPECT_CHECKSUM_ERROR(engine.generate(U"012345"), error_code::invalid_character, U'0');
    EXPECT_CHECKSUM_ERROR(engine.generate(U"abcxez"), error_code::invalid_character, U'x');
    EXPECT_CHECKSUM_ERROR(engine.generate(U"ABC"), error_code::invalid_character, U'A');
    EXPECT_CHECKSUM_ERROR(engine.generate("abcé"), error_code::invalid_character, U'é');
}

TEST(TestLuhnChecksum, EmptyInput)
{
    luhn_checksum engine{U"abcdef"};
    EXPECT_CHECKSUM_ERROR(engine.generate(U""), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.generate(""), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.validate(U""), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.validate(U"a"), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.validate("a"), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.validate_with(U"", U'a'), error_code::empty_input);
    EXPECT_CHECKSUM_ERROR(engine.validate_with(U"a", U'a'), error_code::empty_input);
}

TEST(TestLuhnChecksum, Validate)
{
    luhn_checksum engine{U"abcdef"};
    EXPECT_TRUE(engine.validate(U"abcdefe"));
    EXPECT_FALSE(engine.validate(U"abcdefd"));
    EXPECT_TRUE(engine.validate("abcdefe"));
    EXPECT_FALSE(engine.validate("abcdefd"));

    // A trailing character outside of the alphabet never matches
    EXPECT_FALSE(engine.validate(U"abcdefz"));

    EXPECT_TRUE(luhn_checksum{U"0123456789"}.validate(U"79927398713"));
    EXPECT_FALSE(luhn_checksum{U"0123456789"}.validate(U"79927398710"));
}

TEST(TestLuhnChecksum, ValidateInvalidCharacter)
{
    luhn_checksum engine{U"abcdef"};
    EXPECT_CHECKSUM_ERROR(engine.validate(U"abzdefe"), error_code::invalid_character, U'z');
    EXPECT_CHECKSUM_ERROR(
        engine.validate_with(U"abzdef", U'e'), error_code::invalid_character, U'z');
}

TEST(TestLuhnChecksum, ValidateWith)
{
    luhn_checksum engine{U"abcdef"};
    EXPECT_TRUE(engine.validate_with(U"abcdef", U'e'));
    EXPECT_FALSE(engine.validate_with(U"abcdef", U'd'));
    EXPECT_TRUE(engine.validate_with("abcdef", U'e'));
    EXPECT_FALSE(engine.validate_with("abcdef", U'z'));
}

TEST(TestLuhnChecksum, InvalidEncoding)
{
    EXPECT_CHECKSUM_ERROR(luhn_checksum{"abc\xff"}, error_code::invalid_encoding);

    luhn_checksum engine{"abcdef"};
    EXPECT_CHECKSUM_ERROR(engine.generate("ab\xc3"), error_code::invalid_encoding);
    EXPECT_CHECKSUM_ERROR(engine.validate("ab\x80\x80"), error_code::invalid_encoding);
}

TEST(TestLuhnChecksum, Contains)
{
    luhn_checksum engine{U"0123456789"};
    EXPECT_EQ(engine.size(), 10);
    EXPECT_TRUE(engine.contains(U'0'));
    EXPECT_TRUE(engine.contains(U'9'));
    EXPECT_FALSE(engine.contains(U'a'));
}

} // namespace
