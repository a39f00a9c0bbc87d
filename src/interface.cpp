// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "luhn.h"
#include "utf8.hpp"
#include "version.hpp"

using namespace luhn;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == LUHN_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == LUHN_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == LUHN_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == LUHN_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == LUHN_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == LUHN_LOG_OFF);

namespace {

luhn_log_cb binding_log_cb = nullptr;

void log_relay(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    if (binding_log_cb != nullptr) {
        binding_log_cb(static_cast<LUHN_LOG_LEVEL>(level), function, file, line, message,
            message_len);
    }
}

const char *log_level_to_str(LUHN_LOG_LEVEL level)
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

LUHN_RET_CODE to_ret_code(error_code code)
{
    switch (code) {
    case error_code::empty_alphabet:
        return LUHN_ERR_EMPTY_ALPHABET;
    case error_code::duplicate_character:
        return LUHN_ERR_DUPLICATE_CHARACTER;
    case error_code::empty_input:
        return LUHN_ERR_EMPTY_INPUT;
    case error_code::invalid_character:
        return LUHN_ERR_INVALID_CHARACTER;
    case error_code::invalid_encoding:
        return LUHN_ERR_INVALID_ENCODING;
    }

    return LUHN_ERR_INTERNAL;
}

template <typename Fn>
LUHN_RET_CODE eval_checksum(
    luhn_checksum *handle, const char *input, size_t length, uint32_t *character, Fn &&fn)
{
    if (handle == nullptr || (input == nullptr && length > 0)) {
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    try {
        const std::string_view str{input, length};
        return fn(*handle, str);
    } catch (const checksum_error &e) {
        if (character != nullptr) {
            *character = static_cast<uint32_t>(e.character());
        }
        return to_ret_code(e.code());
    } catch (const std::exception &e) {
        LUHN_ERROR("{}", e.what());
    } catch (...) {
        LUHN_ERROR("unknown exception");
    }

    return LUHN_ERR_INTERNAL;
}

} // namespace

extern "C" {

luhn::luhn_checksum *luhn_init(const char *alphabet, size_t length, luhn_diagnostics *diagnostics)
{
    LUHN_RET_CODE code = LUHN_ERR_INTERNAL;
    char32_t character = 0;

    if (alphabet != nullptr || length == 0) {
        try {
            auto *handle = new luhn::luhn_checksum{std::string_view{alphabet, length}};
            if (diagnostics != nullptr) {
                *diagnostics = {LUHN_OK, 0};
            }
            return handle;
        } catch (const checksum_error &e) {
            LUHN_DEBUG("Failed to initialise alphabet: {}", e.what());
            code = to_ret_code(e.code());
            character = e.character();
        } catch (const std::exception &e) {
            LUHN_ERROR("{}", e.what());
        } catch (...) {
            LUHN_ERROR("unknown exception");
        }
    } else {
        code = LUHN_ERR_INVALID_ARGUMENT;
    }

    if (diagnostics != nullptr) {
        *diagnostics = {code, static_cast<uint32_t>(character)};
    }

    return nullptr;
}

void luhn_destroy(luhn::luhn_checksum *handle) { delete handle; }

uint32_t luhn_alphabet_size(luhn::luhn_checksum *handle)
{
    if (handle == nullptr || handle->size() > std::numeric_limits<uint32_t>::max()) {
        return 0;
    }

    return static_cast<uint32_t>(handle->size());
}

LUHN_RET_CODE luhn_generate(
    luhn::luhn_checksum *handle, const char *input, size_t length, uint32_t *character)
{
    if (character == nullptr) {
        return LUHN_ERR_INVALID_ARGUMENT;
    }

    return eval_checksum(handle, input, length, character,
        [character](const luhn_checksum &engine, std::string_view str) {
            *character = static_cast<uint32_t>(engine.generate(str));
            return LUHN_OK;
        });
}

LUHN_RET_CODE luhn_validate(
    luhn::luhn_checksum *handle, const char *input, size_t length, uint32_t *character)
{
    return eval_checksum(
        handle, input, length, character, [](const luhn_checksum &engine, std::string_view str) {
            return engine.validate(str) ? LUHN_OK : LUHN_MISMATCH;
        });
}

LUHN_RET_CODE luhn_validate_with(luhn::luhn_checksum *handle, const char *input, size_t length,
    uint32_t check, uint32_t *character)
{
    return eval_checksum(handle, input, length, character,
        [check](const luhn_checksum &engine, std::string_view str) {
            return engine.validate_with(str, static_cast<char32_t>(check)) ? LUHN_OK
                                                                           : LUHN_MISMATCH;
        });
}

size_t luhn_encode_character(uint32_t character, char *buffer, size_t length)
{
    if (buffer == nullptr) {
        return 0;
    }

    auto bytes = utf8::encode(static_cast<char32_t>(character));
    if (bytes.empty() || bytes.size() > length) {
        return 0;
    }

    bytes.copy(buffer, bytes.size());
    return bytes.size();
}

const char *luhn_get_version() { return LIBLUHN_VERSION; }

bool luhn_set_log_cb(luhn_log_cb cb, LUHN_LOG_LEVEL min_level)
{
    binding_log_cb = cb;
    luhn::logger::init(cb != nullptr ? log_relay : nullptr, static_cast<log_level>(min_level));
    LUHN_INFO("Sending log messages to binding, min level {}", log_level_to_str(min_level));
    return true;
}

} // extern "C"
