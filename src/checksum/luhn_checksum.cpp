// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utf8.hpp"

namespace luhn {

luhn_checksum::luhn_checksum(std::u32string_view alphabet) : alphabet_(alphabet)
{
    LUHN_DEBUG("Initialised luhn mod {} checksum", alphabet_.size());
}

luhn_checksum::luhn_checksum(std::string_view alphabet) : luhn_checksum(utf8::decode(alphabet)) {}

char32_t luhn_checksum::generate(std::u32string_view input) const
{
    if (input.empty()) {
        throw checksum_error(error_code::empty_input);
    }

    const uint64_t n = alphabet_.size();

    // Factors alternate between 1 and 2, starting from the first character
    uint64_t factor = 1;
    uint64_t sum = 0;
    for (auto c : input) {
        uint64_t addend = factor * alphabet_.codepoint_of(c);
        factor = (factor == 2) ? 1 : 2;

        // Sum of the digits of the addend in base n
        addend = (addend / n) + (addend % n);
        sum += addend;
    }

    const uint64_t remainder = sum % n;
    const uint64_t check_codepoint = (n - remainder) % n;

    return alphabet_.character_of(check_codepoint);
}

char32_t luhn_checksum::generate(std::string_view input) const
{
    return generate(utf8::decode(input));
}

bool luhn_checksum::validate(std::u32string_view input) const
{
    if (input.size() <= 1) {
        throw checksum_error(error_code::empty_input);
    }

    auto head = input.substr(0, input.size() - 1);
    return input.back() == generate(head);
}

bool luhn_checksum::validate(std::string_view input) const
{
    return validate(utf8::decode(input));
}

bool luhn_checksum::validate_with(std::u32string_view input, char32_t check) const
{
    if (input.size() <= 1) {
        throw checksum_error(error_code::empty_input);
    }

    return check == generate(input);
}

bool luhn_checksum::validate_with(std::string_view input, char32_t check) const
{
    return validate_with(utf8::decode(input), check);
}

} // namespace luhn
