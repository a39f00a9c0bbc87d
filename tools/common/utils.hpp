// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "luhn.h"

const char *level_to_str(LUHN_LOG_LEVEL level);

void log_cb(LUHN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

const char *ret_code_to_str(LUHN_RET_CODE code);

// UTF-8 rendering of a character, followed by its U+XXXX notation
std::string character_to_str(uint32_t character);

using args_map = std::map<std::string, std::vector<std::string>, std::less<>>;

// Options are mapped to their long form, positional arguments are stored
// under the empty key. The token after --alphabet or --input is always taken
// as its value, and everything after -- is positional.
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
args_map parse_args(int argc, char *argv[]);

struct operands {
    std::string alphabet;
    std::string input;
};

// Alphabet and input, taken from their options or else from the positional
// arguments in that order. Empty if one is missing or if positional
// arguments are left over.
std::optional<operands> get_operands(const args_map &args);
