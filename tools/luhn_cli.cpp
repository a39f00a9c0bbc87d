// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <array>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "common/utils.hpp"
#include "luhn.h"

namespace {

void print_usage(const char *name)
{
    fmt::print("Usage: {} [--validate] [--verbose] <alphabet> <input>\n"
               "       {} [--validate] [--verbose] --alphabet <alphabet> --input <input>\n"
               "       {} [--validate] [--verbose] -- <alphabet> <input>\n",
        name, name, name);
}

std::string describe_error(LUHN_RET_CODE code, uint32_t character)
{
    if (code == LUHN_ERR_DUPLICATE_CHARACTER || code == LUHN_ERR_INVALID_CHARACTER) {
        return fmt::format("{} {}", ret_code_to_str(code), character_to_str(character));
    }
    return ret_code_to_str(code);
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    if (args.contains("--verbose")) {
        luhn_set_log_cb(log_cb, LUHN_LOG_TRACE);
    } else {
        luhn_set_log_cb(log_cb, LUHN_LOG_OFF);
    }

    if (args.contains("--help")) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto parsed = get_operands(args);
    if (!parsed) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    const auto &[alphabet, input] = *parsed;

    luhn_diagnostics diagnostics{LUHN_OK, 0};
    luhn_handle handle = luhn_init(alphabet.c_str(), alphabet.size(), &diagnostics);
    if (handle == nullptr) {
        fmt::print("Error creating checksum engine: {}\n",
            describe_error(diagnostics.code, diagnostics.character));
        return EXIT_FAILURE;
    }

    uint32_t character = 0;
    if (args.contains("--validate")) {
        auto code = luhn_validate(handle, input.c_str(), input.size(), &character);
        luhn_destroy(handle);

        if (code != LUHN_OK && code != LUHN_MISMATCH) {
            fmt::print("Error validating check character: {}\n", describe_error(code, character));
            return EXIT_FAILURE;
        }

        fmt::print("{}\n", code == LUHN_OK ? "valid" : "invalid");
        return EXIT_SUCCESS;
    }

    auto code = luhn_generate(handle, input.c_str(), input.size(), &character);
    luhn_destroy(handle);

    if (code != LUHN_OK) {
        fmt::print("Error generating check character: {}\n", describe_error(code, character));
        return EXIT_FAILURE;
    }

    std::array<char, 4> buffer{};
    auto length = luhn_encode_character(character, buffer.data(), buffer.size());
    fmt::print("The check character is: {}\n", std::string_view{buffer.data(), length});

    return EXIT_SUCCESS;
}
