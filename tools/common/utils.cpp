// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdio>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "common/utils.hpp"

const char *level_to_str(LUHN_LOG_LEVEL level)
{
    switch (level) {
    case LUHN_LOG_TRACE:
        return "trace";
    case LUHN_LOG_DEBUG:
        return "debug";
    case LUHN_LOG_ERROR:
        return "error";
    case LUHN_LOG_WARN:
        return "warn";
    case LUHN_LOG_INFO:
        return "info";
    case LUHN_LOG_OFF:
        break;
    }

    return "off";
}

void log_cb(LUHN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    fmt::print(stderr, "[{}][{}:{}:{}]: {}\n", level_to_str(level), file, function, line, message);
}

const char *ret_code_to_str(LUHN_RET_CODE code)
{
    switch (code) {
    case LUHN_ERR_INTERNAL:
        return "internal error";
    case LUHN_ERR_INVALID_ARGUMENT:
        return "invalid argument";
    case LUHN_ERR_INVALID_ENCODING:
        return "invalid UTF-8 encoding";
    case LUHN_ERR_INVALID_CHARACTER:
        return "character not in alphabet";
    case LUHN_ERR_EMPTY_INPUT:
        return "empty input";
    case LUHN_ERR_DUPLICATE_CHARACTER:
        return "duplicate character in alphabet";
    case LUHN_ERR_EMPTY_ALPHABET:
        return "empty alphabet";
    case LUHN_OK:
        return "ok";
    case LUHN_MISMATCH:
        return "mismatch";
    }

    return "unknown";
}

std::string character_to_str(uint32_t character)
{
    std::array<char, 4> buffer{};
    auto length = luhn_encode_character(character, buffer.data(), buffer.size());
    return fmt::format("'{}' (U+{:04X})", std::string_view{buffer.data(), length}, character);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
args_map parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-a", "--alphabet"},
        {"--alphabet", "--alphabet"}, {"-i", "--input"}, {"--input", "--input"},
        {"-c", "--validate"}, {"--validate", "--validate"}, {"-v", "--verbose"},
        {"--verbose", "--verbose"}, {"-h", "--help"}, {"--help", "--help"}};
    const std::set<std::string, std::less<>> flags{"--validate", "--verbose", "--help"};

    args_map args;
    auto &positional = args[""];
    bool end_of_options = false;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (!end_of_options) {
            if (arg == "--") {
                end_of_options = true;
                continue;
            }

            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                auto &values = args[long_arg->second];
                if (!flags.contains(long_arg->second) && i + 1 < argc) {
                    values.emplace_back(argv[++i]);
                }
                continue;
            }
        }

        // Unknown options are kept as positional, alphabets may start with '-'
        positional.emplace_back(arg);
    }
    return args;
}

std::optional<operands> get_operands(const args_map &args)
{
    std::vector<std::string> positional;
    if (auto it = args.find(""); it != args.end()) {
        positional = it->second;
    }

    std::size_t next = 0;
    auto take = [&](std::string_view option, std::string &output) {
        if (auto it = args.find(option); it != args.end() && !it->second.empty()) {
            output = it->second.back();
            return true;
        }

        if (next < positional.size()) {
            output = positional[next++];
            return true;
        }

        return false;
    };

    operands result;
    if (!take("--alphabet", result.alphabet) || !take("--input", result.input) ||
        next != positional.size()) {
        return std::nullopt;
    }
    return result;
}
