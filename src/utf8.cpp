// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "exception.hpp"
#include "utf8.hpp"

namespace luhn::utf8 {

namespace {

int8_t find_next_code_unit_sequence_length(const char *utf8Buffer, uint64_t lengthLeft)
{
    if (lengthLeft == 0) {
        return 0;
    }

    // Valid UTF8 has a specific binary format.
    //  If it's a single byte UTF8 character, then it is always of form '0xxxxxxx', where 'x' is any
    //  binary digit. If it's a two byte UTF8 character, then it's always of form '110xxxxx
    //  10xxxxxx'. Similarly for three and four byte UTF8 characters it starts with '1110xxxx' and
    //  '11110xxx' followed
    //      by '10xxxxxx' one less times as there are bytes.

    const auto firstByte = (uint8_t)utf8Buffer[0];
    int8_t expectedSequenceLength = -1;

    // Looking for 0xxxxxxx
    if ((firstByte & 0x80) == 0) {
        return 1;
    }

    // Looking for 110xxxxx
    if ((firstByte >> 5) == 0x6) {
        expectedSequenceLength = 2;
    }

    // Looking for 1110xxxx
    else if ((firstByte >> 4) == 0xe) {
        expectedSequenceLength = 3;
    }

    // Looking for 11110xxx
    else if ((firstByte >> 3) == 0x1e) {
        expectedSequenceLength = 4;
    }

    if (expectedSequenceLength < 0 || ((uint64_t)expectedSequenceLength) > lengthLeft) {
        return -1;
    }

    for (int8_t i = 1; i < expectedSequenceLength; ++i) {
        // Every byte in the sequence must be prefixed by 10xxxxxx
        if ((((uint8_t)utf8Buffer[i]) >> 6) != 0x2) {
            return -1;
        }
    }

    return expectedSequenceLength;
}

// Smallest codepoint which requires a sequence of the given length, anything
// below is an overlong encoding
// NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr std::array<uint32_t, 5> min_codepoint_for_length{0, 0, 0x80, 0x800, 0x10000};

bool is_surrogate(uint32_t codepoint) { return codepoint >= 0xd800 && codepoint <= 0xdfff; }

} // namespace

uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer)
{
    // Handle the easy case of ASCII
    if (codepoint <= 0x7F) {
        *utf8_buffer = (char)codepoint;
        return 1;
    }

    /*
     0x000000-0x00007F: 0xxxxxxx
     0x000080-0x0007FF: 110xxxxx 10xxxxxx
     0x000800-0x00FFFF: 1110xxxx 10xxxxxx 10xxxxxx
     0x010000-0x10FFFF: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
     */

    if (codepoint > max_codepoint || is_surrogate(codepoint)) {
        return 0;
    }

    // 4 bytes representation
    if (codepoint > 0xFFFF) {
        *utf8_buffer++ = (char)(0xF0 | ((codepoint >> 18) & 0x07));
        *utf8_buffer++ = (char)(0x80 | ((codepoint >> 12) & 0x3F));
        *utf8_buffer++ = (char)(0x80 | ((codepoint >> 06) & 0x3F));
        *utf8_buffer++ = (char)(0x80 | (codepoint & 0x3F));
        return 4;
    }

    // Three bytes
    if (codepoint > 0x7FF) {
        *utf8_buffer++ = (char)(0xE0 | ((codepoint >> 12) & 0x0F));
        *utf8_buffer++ = (char)(0x80 | ((codepoint >> 06) & 0x3F));
        *utf8_buffer++ = (char)(0x80 | (codepoint & 0x3F));
        return 3;
    }

    // Two bytes
    *utf8_buffer++ = (char)(0xC0 | ((codepoint >> 06) & 0x1F));
    *utf8_buffer++ = (char)(0x80 | (codepoint & 0x3F));
    return 2;
}

uint32_t fetch_next_codepoint(const char *utf8Buffer, uint64_t &position, uint64_t length)
{
    if (position >= length) {
        return eof;
    }

    const int8_t next_length =
        find_next_code_unit_sequence_length(&utf8Buffer[position], length - position);
    if (next_length == 0) {
        return eof;
    }

    if (next_length < 0) {
        position += 1;
        return invalid;
    }

    if (next_length == 1) {
        return (uint32_t)utf8Buffer[position++];
    }

    //  NGL = 2, buf = 110xxxxx -> buf & 00011111
    //  NGL = 3, buf = 1110xxxx -> buf & 00001111
    //  NGL = 4, buf = 11110xxx -> buf & 00000111
    uint32_t codepoint = (static_cast<uint8_t>(utf8Buffer[position])) & (0xFF >> (next_length + 1));

    // The bytes after the header are formatted like 10xxxxxx, only xxxxxx is
    // appended to the codepoint
    for (int8_t i = 1; i < next_length; ++i) {
        codepoint <<= 6;
        codepoint |= static_cast<uint8_t>(utf8Buffer[position + i]) & 0x3F;
    }

    position += (uint8_t)next_length;

    if (codepoint < min_codepoint_for_length[next_length] || codepoint > max_codepoint ||
        is_surrogate(codepoint)) {
        return invalid;
    }

    return codepoint;
}

std::u32string decode(std::string_view str)
{
    std::u32string output;
    output.reserve(str.size());

    uint64_t position = 0;
    while (position < str.size()) {
        auto codepoint = fetch_next_codepoint(str.data(), position, str.size());
        if (codepoint == invalid) {
            throw checksum_error(error_code::invalid_encoding);
        }

        if (codepoint == eof) {
            break;
        }

        output.push_back(static_cast<char32_t>(codepoint));
    }

    return output;
}

std::string encode(char32_t codepoint)
{
    std::array<char, 4> buffer{};
    auto length = codepoint_to_bytes(codepoint, buffer.data());
    return {buffer.data(), length};
}

} // namespace luhn::utf8
