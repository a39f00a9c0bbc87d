// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include <boost/container/flat_set.hpp>

namespace luhn {

// Sorted set of unique characters, the position of a character within the
// sorted set is its codepoint.
class alphabet {
public:
    explicit alphabet(std::u32string_view characters);

    alphabet(const alphabet &) = default;
    alphabet &operator=(const alphabet &) = default;
    alphabet(alphabet &&) = default;
    alphabet &operator=(alphabet &&) = default;
    ~alphabet() = default;

    [[nodiscard]] std::size_t size() const noexcept { return characters_.size(); }
    [[nodiscard]] bool contains(char32_t character) const
    {
        return characters_.find(character) != characters_.end();
    }

    // Throws checksum_error(error_code::invalid_character) if absent
    [[nodiscard]] std::size_t codepoint_of(char32_t character) const;

    // The codepoint must be lower than size()
    [[nodiscard]] char32_t character_of(std::size_t codepoint) const
    {
        return *characters_.nth(codepoint);
    }

protected:
    boost::container::flat_set<char32_t> characters_;
};

} // namespace luhn
