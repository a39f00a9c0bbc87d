// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "checksum/alphabet.hpp"
#include "exception.hpp"

namespace luhn {

alphabet::alphabet(std::u32string_view characters)
{
    if (characters.empty()) {
        throw checksum_error(error_code::empty_alphabet);
    }

    characters_.reserve(characters.size());
    for (auto c : characters) {
        auto [it, res] = characters_.insert(c);
        if (!res) {
            throw checksum_error(error_code::duplicate_character, c);
        }
    }
}

std::size_t alphabet::codepoint_of(char32_t character) const
{
    auto it = characters_.find(character);
    if (it == characters_.end()) {
        throw checksum_error(error_code::invalid_character, character);
    }
    return characters_.index_of(it);
}

} // namespace luhn
