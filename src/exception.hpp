// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace luhn {

enum class error_code : uint8_t {
    empty_alphabet,
    duplicate_character,
    empty_input,
    invalid_character,
    invalid_encoding,
};

std::string_view error_code_to_str(error_code code);

// Raised by the checksum engine and the UTF-8 decoder, character() is only
// meaningful for duplicate_character and invalid_character.
class checksum_error : public std::exception {
public:
    explicit checksum_error(error_code code, char32_t character = 0);

    checksum_error(const checksum_error &) = default;
    checksum_error &operator=(const checksum_error &) = default;
    checksum_error(checksum_error &&) noexcept = default;
    checksum_error &operator=(checksum_error &&) noexcept = default;
    ~checksum_error() override = default;

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] char32_t character() const noexcept { return character_; }
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    error_code code_;
    char32_t character_;
    std::string what_;
};

} // namespace luhn
