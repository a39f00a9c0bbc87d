// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace luhn::utf8 {

constexpr uint32_t max_codepoint = 0x10FFFF;
constexpr uint32_t invalid = 0xFFFFFFFF;
constexpr uint32_t eof = 0xFFFFFFFE;

// Writes up to 4 bytes, returns 0 for surrogates and out of range values
uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer);

uint32_t fetch_next_codepoint(const char *utf8_buffer, uint64_t &position, uint64_t length);

// Throws checksum_error(error_code::invalid_encoding) on malformed input
std::u32string decode(std::string_view str);

// Empty string if the character can't be encoded
std::string encode(char32_t codepoint);

} // namespace luhn::utf8
