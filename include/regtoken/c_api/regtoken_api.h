#pragma once

#include "regtoken/c_api/regtoken_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

#define REGTOKEN_API_VERSION_MAJOR 1
#define REGTOKEN_API_VERSION_MINOR 0
#define REGTOKEN_API_VERSION_PATCH 0

typedef enum {
    REGTOKEN_SUCCESS = 0,
    REGTOKEN_ERROR_GENERIC = 1,
    REGTOKEN_ERROR_INVALID_INPUT = 2,
    REGTOKEN_ERROR_ENCODING = 3,
    REGTOKEN_ERROR_MALFORMED_TOKEN = 4,
    REGTOKEN_ERROR_DECRYPTION = 5,
    REGTOKEN_ERROR_MALFORMED_PAYLOAD = 6,
    REGTOKEN_ERROR_NULL_POINTER = 7,
    REGTOKEN_ERROR_OUT_OF_MEMORY = 8,
    REGTOKEN_ERROR_SODIUM_FAILURE = 9
} RegtokenErrorCode;

typedef struct RegtokenError {
    RegtokenErrorCode code;
    char* message;
} RegtokenError;

/*
 * Credential bundle as NUL-terminated UTF-8 strings. private_key_pem keeps its
 * line breaks. Structures filled by regtoken_decode own their strings and must
 * be released with regtoken_credentials_free.
 */
typedef struct RegtokenCredentials {
    char* hostname;
    uint16_t ssh_port;
    char* ssh_username;
    char* public_key;
    char* private_key_pem;
    char* generated_at_utc;
} RegtokenCredentials;

REGTOKEN_API const char* regtoken_version(void);

REGTOKEN_API RegtokenErrorCode regtoken_init(void);

/* On success *out_token receives a heap string; free it with regtoken_string_free. */
REGTOKEN_API RegtokenErrorCode regtoken_encode(
    const RegtokenCredentials* credentials,
    char** out_token,
    RegtokenError* out_error);

REGTOKEN_API RegtokenErrorCode regtoken_decode(
    const char* token,
    size_t token_length,
    RegtokenCredentials* out_credentials,
    RegtokenError* out_error);

REGTOKEN_API void regtoken_credentials_free(RegtokenCredentials* credentials);

REGTOKEN_API void regtoken_string_free(char* value);

REGTOKEN_API void regtoken_error_free(RegtokenError* error);

REGTOKEN_API const char* regtoken_error_string(RegtokenErrorCode code);

#ifdef __cplusplus
}
#endif
