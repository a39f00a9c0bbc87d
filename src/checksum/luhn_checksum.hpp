// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "checksum/alphabet.hpp"

namespace luhn {

// Luhn mod N checksum over an arbitrary alphabet, N being the size of the
// alphabet. All operations throw checksum_error on invalid input, the
// std::string_view overloads expect UTF-8.
class luhn_checksum {
public:
    explicit luhn_checksum(std::u32string_view alphabet);
    explicit luhn_checksum(std::string_view alphabet);

    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) = default;
    luhn_checksum &operator=(luhn_checksum &&) = default;
    ~luhn_checksum() = default;

    // Check character to append to the input
    [[nodiscard]] char32_t generate(std::u32string_view input) const;
    [[nodiscard]] char32_t generate(std::string_view input) const;

    // The last character of the input is the check character of the rest
    [[nodiscard]] bool validate(std::u32string_view input) const;
    [[nodiscard]] bool validate(std::string_view input) const;

    [[nodiscard]] bool validate_with(std::u32string_view input, char32_t check) const;
    [[nodiscard]] bool validate_with(std::string_view input, char32_t check) const;

    [[nodiscard]] std::size_t size() const noexcept { return alphabet_.size(); }
    [[nodiscard]] bool contains(char32_t character) const { return alphabet_.contains(character); }

protected:
    alphabet alphabet_;
};

} // namespace luhn
