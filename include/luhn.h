// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2026 Datadog, Inc.

#ifndef LUHN_H
#define LUHN_H

#ifdef __cplusplus
#include <cstddef>

namespace luhn{
class luhn_checksum;
} // namespace luhn

using luhn_handle = luhn::luhn_checksum *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum LUHN_RET_CODE
 *
 * Codes returned by the luhn_* functions.
 **/
typedef enum
{
    LUHN_ERR_INTERNAL            = -7,
    LUHN_ERR_INVALID_ARGUMENT    = -6,
    LUHN_ERR_INVALID_ENCODING    = -5,
    LUHN_ERR_INVALID_CHARACTER   = -4,
    LUHN_ERR_EMPTY_INPUT         = -3,
    LUHN_ERR_DUPLICATE_CHARACTER = -2,
    LUHN_ERR_EMPTY_ALPHABET      = -1,
    LUHN_OK                      = 0,
    LUHN_MISMATCH                = 1,
} LUHN_RET_CODE;

/**
 * @enum LUHN_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    LUHN_LOG_TRACE,
    LUHN_LOG_DEBUG,
    LUHN_LOG_INFO,
    LUHN_LOG_WARN,
    LUHN_LOG_ERROR,
    LUHN_LOG_OFF,
} LUHN_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _luhn_handle* luhn_handle;
#endif

typedef struct _luhn_diagnostics luhn_diagnostics;

/**
 * @struct luhn_diagnostics
 *
 * Reason for a failed luhn_init.
 **/
struct _luhn_diagnostics
{
    /** LUHN_OK on success, otherwise the reason of the failure */
    LUHN_RET_CODE code;
    /** Offending character (Unicode scalar value) for LUHN_ERR_DUPLICATE_CHARACTER, 0 otherwise */
    uint32_t character;
};

/**
 * @typedef luhn_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*luhn_log_cb)(
    LUHN_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * luhn_init
 *
 * Initialize a checksum engine over the given alphabet.
 *
 * @param alphabet UTF-8 string containing every character of the alphabet exactly once. (nonnull)
 * @param length Length of the alphabet in bytes.
 * @param diagnostics Optional failure reason. (nullable)
 *
 * @return Handle to the engine or NULL on error.
 **/
luhn_handle luhn_init(const char *alphabet, size_t length, luhn_diagnostics *diagnostics);

/**
 * luhn_destroy
 *
 * Destroy an engine instance.
 *
 * @param handle Handle to the engine instance.
 */
void luhn_destroy(luhn_handle handle);

/**
 * luhn_alphabet_size
 *
 * Number of characters in the alphabet, which is also the base of the checksum.
 *
 * @param handle Handle to the engine instance.
 *
 * @return Size of the alphabet or 0 if the handle is NULL.
 **/
uint32_t luhn_alphabet_size(luhn_handle handle);

/**
 * luhn_generate
 *
 * Compute the check character of the given payload.
 *
 * @param handle Handle to the engine instance. (nonnull)
 * @param input UTF-8 payload. (nonnull unless length is 0)
 * @param length Length of the payload in bytes.
 * @param character On LUHN_OK, the check character. On LUHN_ERR_INVALID_CHARACTER,
 *                  the first character of the payload absent from the alphabet. (nonnull)
 *
 * @return LUHN_OK or the reason of the failure.
 **/
LUHN_RET_CODE luhn_generate(luhn_handle handle, const char *input, size_t length, uint32_t *character);

/**
 * luhn_validate
 *
 * Validate a string whose last character is the check character of the
 * preceding payload.
 *
 * @param handle Handle to the engine instance. (nonnull)
 * @param input UTF-8 payload followed by its check character. (nonnull unless length is 0)
 * @param length Length of the input in bytes.
 * @param character On LUHN_ERR_INVALID_CHARACTER, the offending character. (nullable)
 *
 * @return LUHN_OK if the check character matches, LUHN_MISMATCH if it doesn't,
 *         otherwise the reason of the failure.
 **/
LUHN_RET_CODE luhn_validate(luhn_handle handle, const char *input, size_t length, uint32_t *character);

/**
 * luhn_validate_with
 *
 * Validate a payload against a separately provided check character.
 *
 * @param handle Handle to the engine instance. (nonnull)
 * @param input UTF-8 payload. (nonnull unless length is 0)
 * @param length Length of the payload in bytes.
 * @param check Expected check character (Unicode scalar value).
 * @param character On LUHN_ERR_INVALID_CHARACTER, the offending character. (nullable)
 *
 * @return LUHN_OK if the check character matches, LUHN_MISMATCH if it doesn't,
 *         otherwise the reason of the failure.
 **/
LUHN_RET_CODE luhn_validate_with(luhn_handle handle, const char *input, size_t length,
    uint32_t check, uint32_t *character);

/**
 * luhn_encode_character
 *
 * Write the UTF-8 representation of a character.
 *
 * @param character Unicode scalar value.
 * @param buffer Output buffer, not NUL-terminated. (nonnull)
 * @param length Size of the buffer, 4 bytes are always enough.
 *
 * @return Number of bytes written, 0 if the character is not a valid scalar
 *         value or the buffer is too small.
 **/
size_t luhn_encode_character(uint32_t character, char *buffer, size_t length);

/**
 * luhn_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *luhn_get_version();

/**
 * luhn_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool luhn_set_log_cb(luhn_log_cb cb, LUHN_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*LUHN_H */
