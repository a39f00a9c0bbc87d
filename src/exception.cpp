// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "exception.hpp"
#include "utf8.hpp"

namespace luhn {

namespace {

std::string describe_character(char32_t character)
{
    return fmt::format(
        "'{}' (U+{:04X})", utf8::encode(character), static_cast<uint32_t>(character));
}

std::string build_message(error_code code, char32_t character)
{
    switch (code) {
    case error_code::empty_alphabet:
        return "alphabet is empty";
    case error_code::duplicate_character:
        return fmt::format("duplicate character {} in alphabet", describe_character(character));
    case error_code::empty_input:
        return "input is empty or too short";
    case error_code::invalid_character:
        return fmt::format("character {} is not in the alphabet", describe_character(character));
    case error_code::invalid_encoding:
        return "input is not valid UTF-8";
    }

    return "unknown error";
}

} // namespace

std::string_view error_code_to_str(error_code code)
{
    switch (code) {
    case error_code::empty_alphabet:
        return "empty_alphabet";
    case error_code::duplicate_character:
        return "duplicate_character";
    case error_code::empty_input:
        return "empty_input";
    case error_code::invalid_character:
        return "invalid_character";
    case error_code::invalid_encoding:
        return "invalid_encoding";
    }

    return "unknown";
}

checksum_error::checksum_error(error_code code, char32_t character)
    : code_(code), character_(character), what_(build_message(code, character))
{}

} // namespace luhn
